#pragma once

#include <jsgraph/enricher_registry.h>
#include <jsgraph/interfaces.h>
#include <jsgraph/logging.h>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace jsgraph {

class DefaultAnalyzerPipeline;

struct PipelineComponents {
  std::unique_ptr<SourceAcquirer> source_acquirer;
  // When null, an AstAnalyzer configured from AnalysisConfig is used.
  std::unique_ptr<FileAnalyzer> analyzer;
  std::shared_ptr<GraphBackend> graph;
  // When empty, enrichers are created from the registry per run.
  std::vector<std::unique_ptr<Enricher>> enrichers;
  std::unique_ptr<Reporter> reporter;
  std::shared_ptr<Logger> logger;
  std::shared_ptr<std::atomic<bool>> cancellation;
  const EnricherRegistry *registry = nullptr;
};

class AnalyzerPipelineBuilder {
public:
  explicit AnalyzerPipelineBuilder(
      const EnricherRegistry &registry = GlobalEnricherRegistry());

  AnalyzerPipelineBuilder &
  WithSourceAcquirer(std::unique_ptr<SourceAcquirer> source_acquirer);
  AnalyzerPipelineBuilder &WithAnalyzer(std::unique_ptr<FileAnalyzer> analyzer);
  AnalyzerPipelineBuilder &WithGraph(std::shared_ptr<GraphBackend> graph);
  AnalyzerPipelineBuilder &WithEnricher(std::unique_ptr<Enricher> enricher);
  AnalyzerPipelineBuilder &WithReporter(std::unique_ptr<Reporter> reporter);
  AnalyzerPipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);
  AnalyzerPipelineBuilder &
  WithCancellation(std::shared_ptr<std::atomic<bool>> cancellation);

  DefaultAnalyzerPipeline Build();

  static AnalyzerPipelineBuilder WithDefaults();

private:
  const EnricherRegistry *registry_;
  PipelineComponents components_;
};

} // namespace jsgraph
