#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

#include "gradebox/common/error.hpp"
#include "gradebox/evaluator/evaluator.hpp"
#include "gradebox/evaluator/report.hpp"
#include "gradebox/evaluator/report_json.hpp"

namespace gradebox::evaluator {

// Fixed set of worker threads running Evaluator::Evaluate for queued
// requests in FIFO order. At most `workers` evaluations are in flight, which
// bounds the number of compiler and submission processes on the host.
// Destruction stops intake, finishes everything already queued, and joins.
class GradingPool {
 public:
  GradingPool(Evaluator& evaluator, std::size_t workers);
  ~GradingPool();

  GradingPool(const GradingPool&) = delete;
  auto operator=(const GradingPool&) -> GradingPool& = delete;
  GradingPool(GradingPool&&) = delete;
  auto operator=(GradingPool&&) -> GradingPool& = delete;

  auto Submit(GradingRequest request) -> std::future<Result<EvaluationReport>>;

  [[nodiscard]] auto WorkerCount() const -> std::size_t {
    return workers_.size();
  }

 private:
  void WorkerLoop(std::stop_token stop_token);

  Evaluator& evaluator_;
  std::mutex mutex_;
  std::condition_variable_any queue_cv_;
  std::deque<std::packaged_task<Result<EvaluationReport>()>> queue_;
  // Declared last so workers are joined before the queue is destroyed
  std::vector<std::jthread> workers_;
};

}  // namespace gradebox::evaluator
