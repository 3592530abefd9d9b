#include "gradebox/evaluator/grading_pool.hpp"

#include <algorithm>
#include <cstddef>
#include <future>
#include <mutex>
#include <stop_token>
#include <utility>

#include <spdlog/spdlog.h>

#include "gradebox/common/error.hpp"
#include "gradebox/evaluator/evaluator.hpp"

namespace gradebox::evaluator {

GradingPool::GradingPool(Evaluator& evaluator, std::size_t workers)
    : evaluator_(evaluator) {
  workers = std::max<std::size_t>(workers, 1);
  workers_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    workers_.emplace_back(
        [this](std::stop_token st) { WorkerLoop(std::move(st)); });
  }
  spdlog::debug("pool: started {} workers", workers);
}

GradingPool::~GradingPool() {
  for (auto& worker : workers_) {
    worker.request_stop();
  }
  queue_cv_.notify_all();
  // jthread destructors join once the queue is drained
}

auto GradingPool::Submit(GradingRequest request)
    -> std::future<Result<EvaluationReport>> {
  std::packaged_task<Result<EvaluationReport>()> task(
      [this, request = std::move(request)]() mutable {
        spdlog::debug("pool: grading request '{}'", request.id);
        return evaluator_.Evaluate(request.source, std::move(request.test_cases));
      });
  auto future = task.get_future();
  {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(task));
  }
  queue_cv_.notify_one();
  return future;
}

void GradingPool::WorkerLoop(std::stop_token stop_token) {
  while (true) {
    std::packaged_task<Result<EvaluationReport>()> task;
    {
      std::unique_lock lock(mutex_);
      queue_cv_.wait(lock, stop_token, [&] { return !queue_.empty(); });
      // Stop was requested and nothing is left to drain
      if (queue_.empty()) {
        return;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    task();
  }
}

}  // namespace gradebox::evaluator
