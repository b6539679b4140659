#include <jsgraph/cli_exit_codes.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/wait.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace jsgraph {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;

std::string LoadFile(const std::filesystem::path &path) {
  std::ifstream stream(path);
  return std::string((std::istreambuf_iterator<char>(stream)),
                     std::istreambuf_iterator<char>());
}

std::filesystem::path ExecutableUnderTest() {
  return std::filesystem::current_path() / "jsgraph";
}

int ExitCode(const std::string &command) {
  return WEXITSTATUS(std::system((command + " 2>/dev/null").c_str()));
}

void AddSampleProject(const test::TemporaryProject &project) {
  project.AddFile("src/errors.js",
                  "export class NotFoundError extends Error {}\n");
  project.AddFile("src/repo.js",
                  "import { NotFoundError } from './errors';\n"
                  "export async function load(id) {\n"
                  "  if (!id) { throw new NotFoundError('missing'); }\n"
                  "  return id;\n"
                  "}\n");
  project.AddFile("src/api.ts",
                  "import { load } from './repo';\n"
                  "export async function handle(id: string): Promise<string> {\n"
                  "  return await load(id);\n"
                  "}\n");
  project.AddFile("node_modules/dep/index.js", "this is not javascript(\n");
}

TEST(CliIntegrationTest, GeneratesReportsForSampleProject) {
  test::TemporaryProject project;
  AddSampleProject(project);

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;

  const auto output_directory = project.root() / "artifacts";
  const std::string command =
      cli.string() + " analyze --root " + project.root().string() +
      " --format markdown,json,graph --out " + output_directory.string();

  ASSERT_EQ(kExitSuccess, ExitCode(command));

  const auto markdown_report = output_directory / "jsgraph_report.md";
  const auto json_report = output_directory / "jsgraph_report.json";
  const auto graph_report = output_directory / "jsgraph_graph.json";
  ASSERT_TRUE(std::filesystem::exists(markdown_report));
  ASSERT_TRUE(std::filesystem::exists(json_report));
  ASSERT_TRUE(std::filesystem::exists(graph_report));

  EXPECT_THAT(LoadFile(markdown_report),
              HasSubstr("| Files Analyzed | 3 |"));
  EXPECT_THAT(LoadFile(json_report), HasSubstr("\"REJECTS\": 2"));
  EXPECT_THAT(LoadFile(graph_report),
              HasSubstr("\"src\": \"src/api.ts->global->FUNCTION->handle\", "
                        "\"dst\": \"src/errors.js->global->CLASS->"
                        "NotFoundError\""));
}

TEST(CliIntegrationTest, DefaultsToMarkdownInProjectRoot) {
  test::TemporaryProject project;
  AddSampleProject(project);

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;

  ASSERT_EQ(kExitSuccess,
            ExitCode(cli.string() + " --root " + project.root().string()));

  EXPECT_TRUE(std::filesystem::exists(project.root() / "jsgraph_report.md"));
  EXPECT_FALSE(std::filesystem::exists(project.root() / "jsgraph_report.json"));
  EXPECT_FALSE(std::filesystem::exists(project.root() / "jsgraph_graph.json"));
}

TEST(CliIntegrationTest, ParseFailuresYieldExitCodeTwo) {
  test::TemporaryProject project;
  AddSampleProject(project);
  project.AddFile("src/broken.js", "function broken( {\n");

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;

  ASSERT_EQ(kExitParseFailures,
            ExitCode(cli.string() + " analyze --root " +
                     project.root().string()));

  const auto markdown = LoadFile(project.root() / "jsgraph_report.md");
  EXPECT_THAT(markdown, HasSubstr("- src/broken.js:"));
  EXPECT_THAT(markdown, HasSubstr("| Files Analyzed | 3 |"));
}

TEST(CliIntegrationTest, UsesConfigFile) {
  test::TemporaryProject project;
  AddSampleProject(project);
  const auto output_directory = project.root() / "reports";
  const auto config_path = project.AddFile(
      "jsgraph.yml", "root: " + project.root().string() + "\n" +
                         "output: " + output_directory.string() + "\n" +
                         "formats: json\n" + "ignored-paths: src/api.ts\n" +
                         "enrichers: imported-calls\n");

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;

  ASSERT_EQ(kExitSuccess,
            ExitCode(cli.string() + " analyze --config " +
                     config_path.string()));

  const auto json = LoadFile(output_directory / "jsgraph_report.json");
  EXPECT_THAT(json, HasSubstr("\"files_analyzed\": 2"));
  EXPECT_THAT(json, HasSubstr("\"enricher\": \"imported-calls\""));
  EXPECT_THAT(json, Not(HasSubstr("rejection-propagation")));
  EXPECT_FALSE(std::filesystem::exists(output_directory / "jsgraph_report.md"));
}

TEST(CliIntegrationTest, InvalidInvocationsYieldExitCodeOne) {
  test::TemporaryProject project;
  AddSampleProject(project);

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;
  const auto root = project.root().string();

  EXPECT_EQ(kExitError, ExitCode(cli.string() + " analyze --bogus"));
  EXPECT_EQ(kExitError, ExitCode(cli.string() + " analyze"));
  EXPECT_EQ(kExitError, ExitCode(cli.string() + " report --root " + root));
  EXPECT_EQ(kExitError,
            ExitCode(cli.string() + " --root " + root + " --enrichers taint"));
  EXPECT_EQ(kExitError,
            ExitCode(cli.string() + " --root " + root + "/absent"));
  EXPECT_FALSE(std::filesystem::exists(project.root() / "jsgraph_report.md"));
  EXPECT_EQ(kExitSuccess, ExitCode(cli.string() + " --help >/dev/null"));
}

} // namespace
} // namespace jsgraph
