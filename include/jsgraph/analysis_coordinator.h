#pragma once

#include <jsgraph/interfaces.h>
#include <jsgraph/logging.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>

namespace jsgraph {

constexpr std::chrono::milliseconds kDefaultLockTimeout{30000};

struct CoordinatorOptions {
  std::chrono::milliseconds lock_timeout = kDefaultLockTimeout;
  std::shared_ptr<Logger> logger;
};

// Serializes full analysis runs against one graph. A routine request made
// while a run is in flight waits for it and shares its result; a forced
// request fails instead of queueing a clear behind the running writer.
class AnalysisCoordinator {
public:
  AnalysisCoordinator(std::shared_ptr<GraphBackend> graph,
                      std::shared_ptr<AnalyzerPipeline> pipeline,
                      CoordinatorOptions options = {});

  // Throws ConcurrencyConflictError for `force` during a run and
  // LockTimeoutError when the in-flight run outlasts the lock timeout.
  AnalysisResult Analyze(const AnalysisConfig &config, bool force = false);

  bool IsRunning() const;
  std::optional<AnalysisResult> LastResult() const;

private:
  AnalysisResult RunLocked(std::unique_lock<std::mutex> &lock,
                           const AnalysisConfig &config, bool clear);

  std::shared_ptr<GraphBackend> graph_;
  std::shared_ptr<AnalyzerPipeline> pipeline_;
  std::chrono::milliseconds lock_timeout_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::condition_variable finished_;
  bool running_ = false;
  bool graph_populated_ = false;
  std::size_t completed_runs_ = 0;
  std::optional<AnalysisResult> last_result_;
};

} // namespace jsgraph
