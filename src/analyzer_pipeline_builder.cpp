#include <jsgraph/analyzer_pipeline_builder.h>

#include <jsgraph/default_analyzer_pipeline.h>
#include <jsgraph/graph_reporter.h>
#include <jsgraph/in_memory_graph_backend.h>
#include <jsgraph/js_source_acquirer.h>

#include <utility>

namespace jsgraph {

AnalyzerPipelineBuilder::AnalyzerPipelineBuilder(
    const EnricherRegistry &registry)
    : registry_(&registry) {}

AnalyzerPipelineBuilder AnalyzerPipelineBuilder::WithDefaults() {
  AnalyzerPipelineBuilder builder;
  builder.WithLogger(std::make_shared<NullLogger>());
  builder.WithSourceAcquirer(
      std::make_unique<JsSourceAcquirer>(builder.components_.logger));
  builder.WithGraph(std::make_shared<InMemoryGraphBackend>());
  return builder;
}

AnalyzerPipelineBuilder &AnalyzerPipelineBuilder::WithSourceAcquirer(
    std::unique_ptr<SourceAcquirer> source_acquirer) {
  components_.source_acquirer = std::move(source_acquirer);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithAnalyzer(std::unique_ptr<FileAnalyzer> analyzer) {
  components_.analyzer = std::move(analyzer);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithGraph(std::shared_ptr<GraphBackend> graph) {
  components_.graph = std::move(graph);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithEnricher(std::unique_ptr<Enricher> enricher) {
  components_.enrichers.push_back(std::move(enricher));
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithReporter(std::unique_ptr<Reporter> reporter) {
  components_.reporter = std::move(reporter);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

AnalyzerPipelineBuilder &AnalyzerPipelineBuilder::WithCancellation(
    std::shared_ptr<std::atomic<bool>> cancellation) {
  components_.cancellation = std::move(cancellation);
  return *this;
}

DefaultAnalyzerPipeline AnalyzerPipelineBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  components_.source_acquirer =
      components_.source_acquirer
          ? std::move(components_.source_acquirer)
          : std::make_unique<JsSourceAcquirer>(components_.logger);
  components_.graph = components_.graph
                          ? std::move(components_.graph)
                          : std::make_shared<InMemoryGraphBackend>();
  components_.reporter = components_.reporter
                             ? std::move(components_.reporter)
                             : std::make_unique<GraphReporter>();
  components_.registry = registry_;
  return DefaultAnalyzerPipeline(std::move(components_));
}

} // namespace jsgraph
