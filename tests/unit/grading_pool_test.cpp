#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include "gradebox/evaluator/evaluator.hpp"
#include "gradebox/evaluator/grading_pool.hpp"
#include "tests/common/fake_engine.hpp"
#include "tests/common/test_support.hpp"

namespace gradebox::evaluator {
namespace {

class GradingPoolTest : public ::testing::Test {
 protected:
  test::TempRoot root_{"pool"};
  test::FakeCompiler compiler_{root_.Path()};
};

auto Request(std::string id, std::string input) -> GradingRequest {
  return GradingRequest{
      .id = std::move(id),
      .source = "src",
      .test_cases = {{.input = input, .expected_output = input, .description = "echo"}},
  };
}

TEST_F(GradingPoolTest, ResultsMatchTheirRequests) {
  test::FakeRunner runner(test::EchoBehavior());
  Evaluator engine(compiler_, runner);
  std::vector<std::future<Result<EvaluationReport>>> futures;
  {
    GradingPool pool(engine, 4);
    for (int i = 0; i < 20; ++i) {
      futures.push_back(pool.Submit(Request(std::to_string(i), std::to_string(i))));
    }
  }

  for (std::size_t i = 0; i < futures.size(); ++i) {
    auto result = futures[i].get();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->overall_correct);
    EXPECT_EQ(result->outcomes[0].actual_output, std::to_string(i));
  }
  EXPECT_EQ(compiler_.CompileCount(), 20U);
}

TEST_F(GradingPoolTest, NeverExceedsWorkerCount) {
  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  test::FakeRunner runner(
      [&](const compiler::Artifact&, std::string_view input)
          -> Result<sandbox::ExecutionResult> {
        int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        --running;
        return test::Exited(std::string(input));
      });
  Evaluator engine(compiler_, runner);
  std::vector<std::future<Result<EvaluationReport>>> futures;
  {
    GradingPool pool(engine, 2);
    EXPECT_EQ(pool.WorkerCount(), 2U);
    for (int i = 0; i < 10; ++i) {
      futures.push_back(pool.Submit(Request(std::to_string(i), "x")));
    }
  }

  for (auto& future : futures) {
    EXPECT_TRUE(future.get().has_value());
  }
  EXPECT_LE(peak.load(), 2);
  EXPECT_GE(peak.load(), 1);
}

TEST_F(GradingPoolTest, DestructionDrainsQueuedWork) {
  test::FakeRunner runner(test::EchoBehavior());
  Evaluator engine(compiler_, runner);
  std::vector<std::future<Result<EvaluationReport>>> futures;
  {
    GradingPool pool(engine, 1);
    for (int i = 0; i < 5; ++i) {
      futures.push_back(pool.Submit(Request(std::to_string(i), "x")));
    }
  }

  for (auto& future : futures) {
    ASSERT_EQ(
        future.wait_for(std::chrono::seconds(0)), std::future_status::ready);
  }
}

TEST_F(GradingPoolTest, ZeroWorkersMeansOne) {
  test::FakeRunner runner(test::EchoBehavior());
  Evaluator engine(compiler_, runner);
  GradingPool pool(engine, 0);

  EXPECT_EQ(pool.WorkerCount(), 1U);
  EXPECT_TRUE(pool.Submit(Request("a", "b")).get().has_value());
}

TEST_F(GradingPoolTest, InternalErrorsAreDelivered) {
  compiler_.BreakWith("no compiler");
  test::FakeRunner runner(test::EchoBehavior());
  Evaluator engine(compiler_, runner);
  GradingPool pool(engine, 2);

  auto result = pool.Submit(Request("a", "b")).get();

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::kInternalError);
}

}  // namespace
}  // namespace gradebox::evaluator
