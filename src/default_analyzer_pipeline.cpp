#include <jsgraph/default_analyzer_pipeline.h>

#include <jsgraph/ast_analyzer.h>
#include <jsgraph/errors.h>
#include <jsgraph/graph_builder.h>
#include <jsgraph/worker_group.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

namespace jsgraph {

namespace {
std::size_t WorkerCount(const AnalysisConfig &config, std::size_t files) {
  std::size_t jobs = config.jobs;
  if (jobs == 0) {
    jobs = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  }
  return std::max<std::size_t>(1, std::min(jobs, files));
}
} // namespace

DefaultAnalyzerPipeline::DefaultAnalyzerPipeline(PipelineComponents components)
    : source_acquirer_(std::move(components.source_acquirer)),
      analyzer_(std::move(components.analyzer)),
      graph_(std::move(components.graph)),
      enrichers_(std::move(components.enrichers)),
      reporter_(std::move(components.reporter)),
      logger_(EnsureLogger(std::move(components.logger))),
      cancellation_(std::move(components.cancellation)),
      registry_(components.registry) {
  if (!source_acquirer_ || !graph_ || !reporter_) {
    throw std::invalid_argument(
        "Pipeline requires a source acquirer, a graph and a reporter");
  }
}

std::vector<std::unique_ptr<Enricher>>
DefaultAnalyzerPipeline::SelectEnrichers(const AnalysisConfig &config) const {
  const auto &registry =
      registry_ != nullptr ? *registry_ : GlobalEnricherRegistry();
  return registry.CreateEnrichers(config.enrichers,
                                  {config.max_iterations, logger_});
}

AnalysisResult DefaultAnalyzerPipeline::Run(const AnalysisConfig &config) {
  logger_->Log(LogLevel::kInfo, "pipeline.start",
               {{"root", config.root_path},
                {"formats", std::to_string(config.formats.size())}});

  const auto pipeline_start = std::chrono::steady_clock::now();
  const auto sources = source_acquirer_->Acquire(config);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "source"},
                {"file_count", std::to_string(sources.files.size())}});

  // Enrichers are resolved before any file is built so a bad name fails
  // the run without touching the graph.
  auto configured_enrichers = enrichers_.empty()
                                  ? SelectEnrichers(config)
                                  : std::vector<std::unique_ptr<Enricher>>{};
  auto &enrichers = enrichers_.empty() ? configured_enrichers : enrichers_;

  const GraphBuilder builder(logger_);
  const AstAnalyzer default_analyzer(AstAnalyzerOptions{config.max_trace_hops});
  const FileAnalyzer &analyzer =
      analyzer_ ? *analyzer_ : static_cast<const FileAnalyzer &>(default_analyzer);

  AnalysisResult result;
  result.project_root = sources.project_root;

  std::atomic<std::size_t> next_file{0};
  std::atomic<std::size_t> analyzed{0};
  std::mutex failures_mutex;
  const auto analyze_files = [&]() {
    while (!(cancellation_ && cancellation_->load())) {
      const auto position = next_file.fetch_add(1);
      if (position >= sources.files.size()) {
        return;
      }
      const auto &file = sources.files[position];
      FileFailure failure;
      failure.file = file.relative_path;
      try {
        builder.Build(analyzer.Analyze(file), *graph_);
        ++analyzed;
        continue;
      } catch (const ParseError &error) {
        failure.line = error.line();
        failure.column = error.column();
        failure.message = error.detail();
      } catch (const std::exception &error) {
        failure.message = error.what();
      }
      logger_->Log(LogLevel::kWarn, "analyzer.file.failed",
                   {{"file", failure.file},
                    {"line", std::to_string(failure.line)},
                    {"message", failure.message}});
      std::lock_guard<std::mutex> lock(failures_mutex);
      result.failures.push_back(std::move(failure));
    }
  };

  const auto workers = WorkerCount(config, sources.files.size());
  {
    WorkerGroup group;
    for (std::size_t i = 1; i < workers; ++i) {
      group.Spawn(analyze_files);
    }
    analyze_files();
    group.JoinAll();
  }

  std::sort(result.failures.begin(), result.failures.end(),
            [](const FileFailure &left, const FileFailure &right) {
              return left.file < right.file;
            });
  result.files_analyzed = analyzed.load();
  result.cancelled = cancellation_ && cancellation_->load();
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "build"},
                {"analyzed", std::to_string(result.files_analyzed)},
                {"failed", std::to_string(result.failures.size())},
                {"workers", std::to_string(workers)}});

  if (!result.cancelled) {
    for (auto &enricher : enrichers) {
      auto enrichment = enricher->Enrich(*graph_);
      result.warnings.insert(result.warnings.end(),
                             enrichment.warnings.begin(),
                             enrichment.warnings.end());
      result.enrichments.push_back(std::move(enrichment));
    }
  } else {
    result.warnings.push_back("analysis cancelled before enrichment");
  }

  result.statistics.nodes = graph_->CountNodesByType();
  result.statistics.edges = graph_->CountEdgesByType();
  result.report = reporter_->Render(result, *graph_, config);

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - pipeline_start)
          .count();
  logger_->Log(LogLevel::kInfo, "pipeline.complete",
               {{"duration_ms", std::to_string(duration_ms)},
                {"files", std::to_string(result.files_analyzed)},
                {"failures", std::to_string(result.failures.size())}});
  return result;
}

} // namespace jsgraph
