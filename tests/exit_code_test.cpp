#include <jsgraph/cli_exit_codes.h>
#include <jsgraph/models.h>

#include <gtest/gtest.h>

namespace jsgraph {
namespace {

TEST(AnalysisExitCodeTest, ReturnsZeroWhenEveryFileWasAnalyzed) {
  AnalysisResult result;
  result.files_analyzed = 3;
  EXPECT_EQ(AnalysisExitCode(result), 0);
}

TEST(AnalysisExitCodeTest, ReturnsTwoWhenAnyFileFailedToParse) {
  AnalysisResult result;
  result.files_analyzed = 2;
  result.failures.push_back({"src/broken.js", 3, 7, "Expected ')'"});

  EXPECT_EQ(AnalysisExitCode(result), 2);
}

TEST(AnalysisExitCodeTest, NonConvergenceDoesNotFailTheRun) {
  AnalysisResult result;
  EnrichmentResult enrichment;
  enrichment.enricher = "rejection-propagation";
  enrichment.converged = false;
  result.enrichments.push_back(enrichment);
  result.warnings.push_back("stopped without converging");

  EXPECT_EQ(AnalysisExitCode(result), kExitSuccess);
}

} // namespace
} // namespace jsgraph
