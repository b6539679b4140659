#include <jsgraph/jsgraph_cli.h>

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace jsgraph {
namespace {

using ::testing::HasSubstr;

std::string InvalidArgumentMessage(const std::vector<std::string> &args) {
  try {
    ParseAnalyzeArguments(args);
  } catch (const std::invalid_argument &error) {
    return error.what();
  }
  return {};
}

TEST(ParseAnalyzeArgumentsTest, ParsesFlagsAndValues) {
  const std::vector<std::string> args = {"--root",
                                         "/project/root",
                                         "--out",
                                         "out-dir",
                                         "--config",
                                         "jsgraph.yml",
                                         "--format",
                                         "Markdown, json,graph,json",
                                         "--extensions",
                                         "js,.TS",
                                         "--ignored-paths",
                                         "dist,generated/api",
                                         "--enrichers",
                                         "Imported-Calls",
                                         "--max-iterations",
                                         "4",
                                         "--max-trace-hops",
                                         "2",
                                         "--jobs",
                                         "0",
                                         "--lock-timeout-ms",
                                         "250",
                                         "--log-level",
                                         "error",
                                         "--force"};

  const auto options = ParseAnalyzeArguments(args);

  ASSERT_TRUE(options.root);
  EXPECT_EQ(options.root->generic_string(), "/project/root");
  ASSERT_TRUE(options.output_directory);
  EXPECT_EQ(options.output_directory->generic_string(), "out-dir");
  ASSERT_TRUE(options.config_file);
  EXPECT_EQ(options.config_file->generic_string(), "jsgraph.yml");
  EXPECT_EQ(options.formats,
            (std::vector<std::string>{"markdown", "json", "graph"}));
  EXPECT_EQ(options.extensions, (std::vector<std::string>{".js", ".ts"}));
  EXPECT_EQ(options.ignored_paths,
            (std::vector<std::string>{"dist", "generated/api"}));
  EXPECT_EQ(options.enrichers, (std::vector<std::string>{"imported-calls"}));
  EXPECT_EQ(options.max_iterations, std::optional<std::size_t>(4));
  EXPECT_EQ(options.max_trace_hops, std::optional<std::size_t>(2));
  EXPECT_EQ(options.jobs, std::optional<std::size_t>(0));
  EXPECT_EQ(options.lock_timeout_ms, std::optional<std::size_t>(250));
  EXPECT_EQ(options.log_level, std::optional<LogLevel>(LogLevel::kError));
  EXPECT_TRUE(options.force);
  EXPECT_FALSE(options.show_help);
}

TEST(ParseAnalyzeArgumentsTest, VerbosityShortcuts) {
  EXPECT_EQ(ParseAnalyzeArguments({"--verbose"}).log_level,
            std::optional<LogLevel>(LogLevel::kInfo));
  EXPECT_EQ(ParseAnalyzeArguments({"--debug"}).log_level,
            std::optional<LogLevel>(LogLevel::kDebug));
  EXPECT_EQ(ParseAnalyzeArguments({"--debug", "--verbose"}).log_level,
            std::optional<LogLevel>(LogLevel::kInfo));
}

TEST(ParseAnalyzeArgumentsTest, HelpStopsParsing) {
  const auto options = ParseAnalyzeArguments({"--help", "--bogus"});

  EXPECT_TRUE(options.show_help);
  EXPECT_TRUE(ResolveAnalyzeOptions(options).show_help);
}

TEST(ParseAnalyzeArgumentsTest, ReportsInvalidArguments) {
  EXPECT_EQ("Unknown argument: --bogus", InvalidArgumentMessage({"--bogus"}));
  EXPECT_EQ("--root requires a value", InvalidArgumentMessage({"--root"}));
  EXPECT_THAT(InvalidArgumentMessage({"--format", "html"}),
              HasSubstr("Unsupported format: html"));
  EXPECT_THAT(InvalidArgumentMessage({"--max-iterations", "0"}),
              HasSubstr("must be at least 1"));
  EXPECT_THAT(InvalidArgumentMessage({"--max-trace-hops", "-3"}),
              HasSubstr("non-negative integer"));
  EXPECT_THAT(InvalidArgumentMessage({"--jobs", "many"}),
              HasSubstr("non-negative integer"));
  EXPECT_THROW(ParseAnalyzeArguments({"--log-level", "loud"}),
               std::invalid_argument);
}

TEST(ConfigKeyTest, NormalizesAliasesAndSeparators) {
  EXPECT_EQ("out", NormalizeConfigKey("output"));
  EXPECT_EQ("out", NormalizeConfigKey("Output-Directory"));
  EXPECT_EQ("formats", NormalizeConfigKey("format"));
  EXPECT_EQ("max_iterations", NormalizeConfigKey(" max-iterations "));
  EXPECT_EQ("lock_timeout_ms", NormalizeConfigKey("lock_timeout_ms"));
}

TEST(ParseConfigFileTest, ParsesYamlValuesAndLists) {
  test::TemporaryProject project;
  const auto config = project.AddFile("jsgraph.yaml",
                                      "root: /from/yaml\n"
                                      "output: reports\n"
                                      "format:\n"
                                      "  - json\n"
                                      "  - graph\n"
                                      "extensions: ts\n"
                                      "ignored-paths:\n"
                                      "  - dist\n"
                                      "enrichers:\n"
                                      "  - rejection-propagation\n"
                                      "max-iterations: 3\n"
                                      "max_trace_hops: 7\n"
                                      "jobs: 2\n"
                                      "lock-timeout-ms: 1000\n"
                                      "log_level: info\n");

  const auto options = ParseConfigFile(config);

  ASSERT_TRUE(options.root);
  EXPECT_EQ(options.root->generic_string(), "/from/yaml");
  ASSERT_TRUE(options.output_directory);
  EXPECT_EQ(options.output_directory->generic_string(), "reports");
  EXPECT_EQ(options.config_file, std::optional<std::filesystem::path>(config));
  EXPECT_EQ(options.formats, (std::vector<std::string>{"json", "graph"}));
  EXPECT_EQ(options.extensions, (std::vector<std::string>{".ts"}));
  EXPECT_EQ(options.ignored_paths, (std::vector<std::string>{"dist"}));
  EXPECT_EQ(options.enrichers,
            (std::vector<std::string>{"rejection-propagation"}));
  EXPECT_EQ(options.max_iterations, std::optional<std::size_t>(3));
  EXPECT_EQ(options.max_trace_hops, std::optional<std::size_t>(7));
  EXPECT_EQ(options.jobs, std::optional<std::size_t>(2));
  EXPECT_EQ(options.lock_timeout_ms, std::optional<std::size_t>(1000));
  EXPECT_EQ(options.log_level, std::optional<LogLevel>(LogLevel::kInfo));
}

TEST(ParseConfigFileTest, RejectsUnknownKeysWithSupportedList) {
  test::TemporaryProject project;
  const auto config =
      project.AddFile("jsgraph.yml", "root: /project\nunexpected: true\n");

  try {
    ParseConfigFile(config);
    FAIL() << "expected std::invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_THAT(error.what(), HasSubstr("Unknown config key: unexpected"));
    EXPECT_THAT(error.what(), HasSubstr("root, out, formats"));
  }
}

TEST(ParseConfigFileTest, RejectsMissingFilesAndOtherFormats) {
  test::TemporaryProject project;
  const auto json = project.AddFile("jsgraph.json", "{}");

  EXPECT_THROW(ParseConfigFile(project.root() / "missing.yml"),
               std::runtime_error);
  EXPECT_THROW(ParseConfigFile(json), std::invalid_argument);
}

TEST(ParseConfigFileTest, RejectsMalformedValues) {
  test::TemporaryProject project;
  const auto nested = project.AddFile("nested.yml", "root:\n  path: /x\n");
  const auto bad_format = project.AddFile("format.yml", "formats: [pdf]\n");
  const auto scalar_root = project.AddFile("list.yml", "- root\n");

  EXPECT_THROW(ParseConfigFile(nested), std::invalid_argument);
  EXPECT_THROW(ParseConfigFile(bad_format), std::invalid_argument);
  EXPECT_THROW(ParseConfigFile(scalar_root), std::invalid_argument);
}

TEST(ResolveAnalyzeOptionsTest, CliOverridesConfig) {
  test::TemporaryProject project;
  const auto config = project.AddFile("jsgraph.yml",
                                      "root: /config/root\n"
                                      "formats: markdown\n"
                                      "max_iterations: 8\n"
                                      "enrichers: imported-calls\n");

  AnalyzeOptions cli_options;
  cli_options.root = "/cli/root";
  cli_options.formats = {"json"};
  cli_options.config_file = config;
  cli_options.force = true;

  const auto resolved = ResolveAnalyzeOptions(cli_options);

  EXPECT_EQ(resolved.root->generic_string(), "/cli/root");
  EXPECT_EQ(resolved.formats, (std::vector<std::string>{"json"}));
  EXPECT_EQ(resolved.max_iterations, std::optional<std::size_t>(8));
  EXPECT_EQ(resolved.enrichers, (std::vector<std::string>{"imported-calls"}));
  EXPECT_TRUE(resolved.force);
}

TEST(ResolveAnalyzeOptionsTest, RequiresRoot) {
  EXPECT_THROW(ResolveAnalyzeOptions(AnalyzeOptions{}), std::invalid_argument);
}

TEST(BuildAnalysisConfigTest, AppliesDefaultsAndAnchorsIgnoredPaths) {
  test::TemporaryProject project;
  AnalyzeOptions options;
  options.ignored_paths = {"dist", "/opt/vendor"};
  options.max_trace_hops = 3;

  const auto config = BuildAnalysisConfig(options, project.root());

  EXPECT_EQ(project.root().string(), config.root_path);
  EXPECT_EQ(config.formats, (std::vector<std::string>{"markdown"}));
  EXPECT_EQ(kDefaultMaxIterations, config.max_iterations);
  EXPECT_EQ(3u, config.max_trace_hops);
  EXPECT_EQ(0u, config.jobs);
  ASSERT_EQ(2u, config.ignored_paths.size());
  EXPECT_EQ(
      std::filesystem::weakly_canonical(project.root() / "dist").generic_string(),
      config.ignored_paths[0]);
  EXPECT_EQ("/opt/vendor", config.ignored_paths[1]);
}

} // namespace
} // namespace jsgraph
