#include <jsgraph/analysis_coordinator.h>
#include <jsgraph/errors.h>
#include <jsgraph/in_memory_graph_backend.h>
#include <jsgraph/node_factory.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace jsgraph {
namespace {

// Pipeline whose runs block until the test opens the gate.
class GatedPipeline : public AnalyzerPipeline {
public:
  explicit GatedPipeline(bool open = true) : open_(open) {}

  AnalysisResult Run(const AnalysisConfig &config) override {
    std::unique_lock<std::mutex> lock(mutex_);
    ++started_;
    changed_.notify_all();
    changed_.wait(lock, [this]() { return open_; });
    if (fail_) {
      throw std::runtime_error("pipeline failed");
    }
    AnalysisResult result;
    result.project_root = config.root_path;
    result.files_analyzed = static_cast<std::size_t>(started_);
    return result;
  }

  void Open() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = true;
    changed_.notify_all();
  }

  void WaitUntilStarted(int runs) {
    std::unique_lock<std::mutex> lock(mutex_);
    changed_.wait(lock, [&]() { return started_ >= runs; });
  }

  int started() {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
  }

  void FailRuns() {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_ = true;
  }

private:
  std::mutex mutex_;
  std::condition_variable changed_;
  bool open_;
  bool fail_ = false;
  int started_ = 0;
};

class AnalysisCoordinatorTest : public ::testing::Test {
protected:
  void AddMarkerNode() {
    graph_->AddNode(NodeFactory::CreateModule("marker.js"));
  }

  std::size_t NodeCount() const { return graph_->QueryNodes({}).size(); }

  std::shared_ptr<InMemoryGraphBackend> graph_ =
      std::make_shared<InMemoryGraphBackend>();
  AnalysisConfig config_{.root_path = "/project"};
};

TEST_F(AnalysisCoordinatorTest, ClearsGraphOnFirstAndForcedRunsOnly) {
  auto pipeline = std::make_shared<GatedPipeline>();
  AnalysisCoordinator coordinator(graph_, pipeline);
  AddMarkerNode();

  EXPECT_FALSE(coordinator.LastResult());
  coordinator.Analyze(config_);
  EXPECT_EQ(0u, NodeCount());

  AddMarkerNode();
  const auto second = coordinator.Analyze(config_);
  EXPECT_EQ(1u, NodeCount());
  EXPECT_EQ(2u, second.files_analyzed);

  coordinator.Analyze(config_, true);
  EXPECT_EQ(0u, NodeCount());
  EXPECT_EQ(3, pipeline->started());
  ASSERT_TRUE(coordinator.LastResult());
  EXPECT_EQ(3u, coordinator.LastResult()->files_analyzed);
  EXPECT_FALSE(coordinator.IsRunning());
}

TEST_F(AnalysisCoordinatorTest, WaitingRequestSharesInFlightResult) {
  auto pipeline = std::make_shared<GatedPipeline>(false);
  AnalysisCoordinator coordinator(graph_, pipeline);

  AnalysisResult first;
  AnalysisResult second;
  std::thread running([&]() { first = coordinator.Analyze(config_); });
  pipeline->WaitUntilStarted(1);
  EXPECT_TRUE(coordinator.IsRunning());
  std::thread waiting([&]() { second = coordinator.Analyze(config_); });
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  pipeline->Open();
  running.join();
  waiting.join();

  EXPECT_EQ(1, pipeline->started());
  EXPECT_EQ(1u, first.files_analyzed);
  EXPECT_EQ(1u, second.files_analyzed);
  EXPECT_FALSE(coordinator.IsRunning());
}

TEST_F(AnalysisCoordinatorTest, ForcedRequestDuringRunConflicts) {
  auto pipeline = std::make_shared<GatedPipeline>(false);
  AnalysisCoordinator coordinator(graph_, pipeline);

  std::thread running([&]() { coordinator.Analyze(config_); });
  pipeline->WaitUntilStarted(1);

  EXPECT_THROW(coordinator.Analyze(config_, true), ConcurrencyConflictError);

  pipeline->Open();
  running.join();
  EXPECT_EQ(1, pipeline->started());
}

TEST_F(AnalysisCoordinatorTest, WaitingRequestTimesOut) {
  auto pipeline = std::make_shared<GatedPipeline>(false);
  CoordinatorOptions options;
  options.lock_timeout = std::chrono::milliseconds(20);
  AnalysisCoordinator coordinator(graph_, pipeline, options);

  std::thread running([&]() { coordinator.Analyze(config_); });
  pipeline->WaitUntilStarted(1);

  EXPECT_THROW(coordinator.Analyze(config_), LockTimeoutError);

  pipeline->Open();
  running.join();
  EXPECT_EQ(1, pipeline->started());
}

TEST_F(AnalysisCoordinatorTest, FailedRunReleasesTheGraph) {
  auto pipeline = std::make_shared<GatedPipeline>();
  pipeline->FailRuns();
  AnalysisCoordinator coordinator(graph_, pipeline);

  EXPECT_THROW(coordinator.Analyze(config_), std::runtime_error);

  EXPECT_FALSE(coordinator.IsRunning());
  EXPECT_FALSE(coordinator.LastResult());
  EXPECT_THROW(coordinator.Analyze(config_), std::runtime_error);
  EXPECT_EQ(2, pipeline->started());
}

TEST_F(AnalysisCoordinatorTest, RequiresGraphAndPipeline) {
  EXPECT_THROW(AnalysisCoordinator(nullptr, std::make_shared<GatedPipeline>()),
               std::invalid_argument);
  EXPECT_THROW(AnalysisCoordinator(graph_, nullptr), std::invalid_argument);
}

} // namespace
} // namespace jsgraph
