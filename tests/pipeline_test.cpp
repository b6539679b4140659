#include <jsgraph/analyzer_pipeline_builder.h>
#include <jsgraph/default_analyzer_pipeline.h>
#include <jsgraph/in_memory_graph_backend.h>

#include <atomic>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/project_graph.h"
#include "test_support/temporary_project.h"

namespace jsgraph {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using test::EdgesBetween;

class RecordingEnricher : public Enricher {
public:
  explicit RecordingEnricher(std::shared_ptr<int> runs)
      : runs_(std::move(runs)) {}

  std::string Name() const override { return "recording"; }
  EnrichmentResult Enrich(GraphBackend &) override {
    ++*runs_;
    EnrichmentResult result;
    result.enricher = Name();
    result.iterations = 1;
    result.warnings = {"recorded"};
    return result;
  }

private:
  std::shared_ptr<int> runs_;
};

class PipelineTest : public ::testing::Test {
protected:
  void SetUp() override {
    project_.AddFile("src/errors.js",
                     "export class NotFoundError extends Error {}\n");
    project_.AddFile("src/repo.js",
                     "import { NotFoundError } from './errors';\n"
                     "export async function load(id) {\n"
                     "  throw new NotFoundError(id);\n"
                     "}\n");
    project_.AddFile("src/api.js",
                     "import { load } from './repo';\n"
                     "export async function handle(id) {\n"
                     "  return await load(id);\n"
                     "}\n");
  }

  AnalysisConfig MakeConfig() const {
    return AnalysisConfig{.root_path = project_.root().string(),
                          .formats = {"markdown", "json"}};
  }

  test::TemporaryProject project_;
  std::shared_ptr<InMemoryGraphBackend> graph_ =
      std::make_shared<InMemoryGraphBackend>();
};

TEST_F(PipelineTest, DefaultsBuildEnrichAndReport) {
  auto builder = AnalyzerPipelineBuilder::WithDefaults();
  builder.WithGraph(graph_);
  auto pipeline = builder.Build();

  const auto result = pipeline.Run(MakeConfig());

  EXPECT_EQ(3u, result.files_analyzed);
  EXPECT_THAT(result.failures, IsEmpty());
  EXPECT_FALSE(result.cancelled);
  ASSERT_EQ(2u, result.enrichments.size());
  EXPECT_EQ("imported-calls", result.enrichments[0].enricher);
  EXPECT_EQ("rejection-propagation", result.enrichments[1].enricher);
  EXPECT_EQ(3u, result.statistics.nodes.at(NodeType::kModule));
  EXPECT_EQ(2u, result.statistics.edges.at(EdgeType::kRejects));
  EXPECT_EQ(1u, EdgesBetween(*graph_, EdgeType::kRejects,
                             "src/api.js->global->FUNCTION->handle",
                             "src/errors.js->global->CLASS->NotFoundError")
                    .size());
  EXPECT_THAT(result.report.markdown, HasSubstr("## Enrichment"));
  EXPECT_THAT(result.report.json, HasSubstr("\"files_analyzed\": 3"));
  EXPECT_THAT(result.report.graph_json, IsEmpty());
}

TEST_F(PipelineTest, RecordsParseFailuresAndKeepsGoing) {
  project_.AddFile("src/broken.ts", "const = 1;\n");
  auto builder = AnalyzerPipelineBuilder::WithDefaults();
  builder.WithGraph(graph_);
  auto pipeline = builder.Build();

  const auto result = pipeline.Run(MakeConfig());

  EXPECT_EQ(3u, result.files_analyzed);
  ASSERT_EQ(1u, result.failures.size());
  EXPECT_EQ("src/broken.ts", result.failures[0].file);
  EXPECT_EQ(1, result.failures[0].line);
  EXPECT_GE(result.failures[0].column, 1);
  NodeFilter broken;
  broken.file = "src/broken.ts";
  EXPECT_THAT(graph_->QueryNodes(broken), IsEmpty());
  EXPECT_EQ(2u, result.statistics.edges.at(EdgeType::kRejects));
}

TEST_F(PipelineTest, ResultsDoNotDependOnWorkerCount) {
  auto single_graph = std::make_shared<InMemoryGraphBackend>();
  auto single = AnalyzerPipelineBuilder::WithDefaults();
  single.WithGraph(single_graph);
  auto parallel = AnalyzerPipelineBuilder::WithDefaults();
  parallel.WithGraph(graph_);
  auto config = MakeConfig();

  config.jobs = 1;
  const auto single_result = single.Build().Run(config);
  config.jobs = 4;
  const auto parallel_result = parallel.Build().Run(config);

  EXPECT_EQ(single_result.statistics.nodes, parallel_result.statistics.nodes);
  EXPECT_EQ(single_result.statistics.edges, parallel_result.statistics.edges);
  EXPECT_EQ(single_graph->QueryEdges({}).size(), graph_->QueryEdges({}).size());
}

TEST_F(PipelineTest, ExplicitEnrichersReplaceRegistrySelection) {
  auto runs = std::make_shared<int>(0);
  auto builder = AnalyzerPipelineBuilder::WithDefaults();
  builder.WithGraph(graph_).WithEnricher(
      std::make_unique<RecordingEnricher>(runs));
  auto pipeline = builder.Build();

  const auto result = pipeline.Run(MakeConfig());

  EXPECT_EQ(1, *runs);
  ASSERT_EQ(1u, result.enrichments.size());
  EXPECT_EQ("recording", result.enrichments[0].enricher);
  EXPECT_THAT(result.warnings, ElementsAre("recorded"));
  // Imported error classes are only linked by the imported-calls enricher.
  EXPECT_EQ(0u, result.statistics.edges.count(EdgeType::kRejects));
}

TEST_F(PipelineTest, SelectsEnrichersByName) {
  auto builder = AnalyzerPipelineBuilder::WithDefaults();
  builder.WithGraph(graph_);
  auto pipeline = builder.Build();
  auto config = MakeConfig();
  config.enrichers = {"imported-calls"};

  const auto result = pipeline.Run(config);

  ASSERT_EQ(1u, result.enrichments.size());
  EXPECT_EQ("imported-calls", result.enrichments[0].enricher);
  EXPECT_EQ(1u, result.statistics.edges.at(EdgeType::kRejects));
}

TEST_F(PipelineTest, UnknownEnricherFailsBeforeTheGraphIsWritten) {
  auto builder = AnalyzerPipelineBuilder::WithDefaults();
  builder.WithGraph(graph_);
  auto pipeline = builder.Build();
  auto config = MakeConfig();
  config.enrichers = {"taint"};

  EXPECT_THROW(pipeline.Run(config), std::invalid_argument);
  EXPECT_THAT(graph_->QueryNodes({}), IsEmpty());
}

TEST_F(PipelineTest, CancellationSkipsRemainingWork) {
  auto cancellation = std::make_shared<std::atomic<bool>>(true);
  auto builder = AnalyzerPipelineBuilder::WithDefaults();
  builder.WithGraph(graph_).WithCancellation(cancellation);
  auto pipeline = builder.Build();

  const auto result = pipeline.Run(MakeConfig());

  EXPECT_TRUE(result.cancelled);
  EXPECT_EQ(0u, result.files_analyzed);
  EXPECT_THAT(result.enrichments, IsEmpty());
  EXPECT_THAT(result.warnings, Contains(HasSubstr("cancelled")));
  EXPECT_THAT(graph_->QueryNodes({}), IsEmpty());
}

TEST_F(PipelineTest, LogsStagesThroughInjectedLogger) {
  std::stringstream log;
  auto builder = AnalyzerPipelineBuilder::WithDefaults();
  builder.WithGraph(graph_).WithLogger(MakeLogger({LogLevel::kDebug}, log));
  auto pipeline = builder.Build();

  pipeline.Run(MakeConfig());

  EXPECT_THAT(log.str(), HasSubstr("message=\"pipeline.start\""));
  EXPECT_THAT(log.str(), HasSubstr("\"stage\": \"build\""));
  EXPECT_THAT(log.str(), HasSubstr("message=\"pipeline.complete\""));
}

TEST(PipelineConstructionTest, RequiresCoreComponents) {
  EXPECT_THROW(DefaultAnalyzerPipeline(PipelineComponents{}),
               std::invalid_argument);
}

} // namespace
} // namespace jsgraph
