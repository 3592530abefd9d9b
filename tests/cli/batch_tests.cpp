#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>

#include "tests/cli/cli_test_fixture.hpp"

namespace gradebox::test {
namespace {

class BatchTest : public CliTestFixture {
 protected:
  void WriteRequests(const nlohmann::json& requests) {
    WriteFile("requests.json", requests.dump());
  }
};

TEST_F(BatchTest, GradesEveryRequestInOrder) {
  if (!HaveCompiler()) {
    GTEST_SKIP() << "gcc not found on PATH";
  }
  WriteRequests(nlohmann::json::array({
      {{"id", "good"},
       {"source", kSumProgram},
       {"test_cases", nlohmann::json::parse(kSumTests)}},
      {{"id", "broken"},
       {"source", "int main(void) { return 0\n"},
       {"test_cases", kSumTests}},
      {{"source", "int main(void) { return 0; }\n"}},
  }));
  WriteFile("gradebox.toml", "[pool]\nworkers = 2\n");

  auto result = Run({"batch", "requests.json"});

  ASSERT_EQ(result.exit_code, 0) << result.combined_output;
  auto results = nlohmann::json::parse(result.stdout_output);
  ASSERT_EQ(results.size(), 3U);

  EXPECT_EQ(results[0]["id"], "good");
  EXPECT_EQ(results[0]["report"]["overallCorrect"], true);
  EXPECT_EQ(results[0]["report"]["passedCount"], 2);

  EXPECT_EQ(results[1]["id"], "broken");
  EXPECT_EQ(results[1]["report"]["error"], "Compilation failed");
  EXPECT_EQ(results[1]["report"]["totalCount"], 2);

  // Missing id defaults to the 1-based position
  EXPECT_EQ(results[2]["id"], "3");
  EXPECT_EQ(results[2]["report"]["overallCorrect"], true);
}

TEST_F(BatchTest, RequestFileMustBeArray) {
  WriteFile("requests.json", R"({"source": "int main(void) {}"})");

  auto result = Run({"batch", "requests.json"});

  EXPECT_EQ(result.exit_code, 64);
}

TEST_F(BatchTest, RequestWithoutSourceIsRejected) {
  WriteRequests(nlohmann::json::array({{{"id", "x"}}}));

  auto result = Run({"batch", "requests.json"});

  EXPECT_EQ(result.exit_code, 64);
  EXPECT_NE(result.stderr_output.find("source"), std::string::npos);
}

TEST_F(BatchTest, MissingRequestFile) {
  auto result = Run({"batch", "absent.json"});

  EXPECT_EQ(result.exit_code, 64);
  EXPECT_NE(result.stderr_output.find("cannot read request file"),
            std::string::npos);
}

}  // namespace
}  // namespace gradebox::test
