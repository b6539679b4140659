#pragma once

#include <jsgraph/analyzer_pipeline_builder.h>

#include <memory>
#include <vector>

namespace jsgraph {

// Acquire, analyze and build every file on worker threads, then run the
// enrichers over the finished graph and render the report.
class DefaultAnalyzerPipeline : public AnalyzerPipeline {
public:
  explicit DefaultAnalyzerPipeline(PipelineComponents components);

  AnalysisResult Run(const AnalysisConfig &config) override;

  const std::shared_ptr<GraphBackend> &graph() const { return graph_; }

private:
  std::vector<std::unique_ptr<Enricher>>
  SelectEnrichers(const AnalysisConfig &config) const;

  std::unique_ptr<SourceAcquirer> source_acquirer_;
  std::unique_ptr<FileAnalyzer> analyzer_;
  std::shared_ptr<GraphBackend> graph_;
  std::vector<std::unique_ptr<Enricher>> enrichers_;
  std::unique_ptr<Reporter> reporter_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<std::atomic<bool>> cancellation_;
  const EnricherRegistry *registry_;
};

} // namespace jsgraph
