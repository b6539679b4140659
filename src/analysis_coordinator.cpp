#include <jsgraph/analysis_coordinator.h>

#include <jsgraph/errors.h>

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace jsgraph {

AnalysisCoordinator::AnalysisCoordinator(
    std::shared_ptr<GraphBackend> graph,
    std::shared_ptr<AnalyzerPipeline> pipeline, CoordinatorOptions options)
    : graph_(std::move(graph)), pipeline_(std::move(pipeline)),
      lock_timeout_(options.lock_timeout),
      logger_(EnsureLogger(std::move(options.logger))) {
  if (!graph_ || !pipeline_) {
    throw std::invalid_argument("Coordinator requires a graph and a pipeline");
  }
}

AnalysisResult AnalysisCoordinator::Analyze(const AnalysisConfig &config,
                                            bool force) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (running_) {
    if (force) {
      throw ConcurrencyConflictError(
          "An analysis is already running for this graph. Wait for it to "
          "finish or poll IsRunning() before forcing a re-run.");
    }
    const auto runs_before_wait = completed_runs_;
    if (!finished_.wait_for(lock, lock_timeout_,
                            [this]() { return !running_; })) {
      logger_->Log(LogLevel::kError, "coordinator.lock.timeout",
                   {{"timeout_ms", std::to_string(lock_timeout_.count())}});
      throw LockTimeoutError(
          "Timed out after " + std::to_string(lock_timeout_.count()) +
          " ms waiting for the running analysis. Check the logs for a stuck "
          "run or restart the process.");
    }
    if (completed_runs_ != runs_before_wait && last_result_) {
      return *last_result_;
    }
  }
  return RunLocked(lock, config, force || !graph_populated_);
}

AnalysisResult
AnalysisCoordinator::RunLocked(std::unique_lock<std::mutex> &lock,
                               const AnalysisConfig &config, bool clear) {
  running_ = true;
  lock.unlock();

  const auto finish = [this](std::optional<AnalysisResult> result) {
    {
      std::lock_guard<std::mutex> guard(mutex_);
      running_ = false;
      if (result) {
        graph_populated_ = true;
        ++completed_runs_;
        last_result_ = std::move(result);
      }
    }
    finished_.notify_all();
  };

  try {
    if (clear) {
      const auto cleared = graph_->Clear();
      logger_->Log(LogLevel::kInfo, "coordinator.clear",
                   {{"removed", std::to_string(cleared.written)}});
    }
    auto result = pipeline_->Run(config);
    finish(result);
    return result;
  } catch (const std::exception &) {
    finish(std::nullopt);
    throw;
  }
}

bool AnalysisCoordinator::IsRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

std::optional<AnalysisResult> AnalysisCoordinator::LastResult() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_result_;
}

} // namespace jsgraph
