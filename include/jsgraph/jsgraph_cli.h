#pragma once

#include <jsgraph/logging.h>
#include <jsgraph/models.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace jsgraph {

struct AnalyzeOptions {
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> output_directory;
  std::optional<std::filesystem::path> config_file;
  std::vector<std::string> formats;
  std::vector<std::string> extensions;
  std::vector<std::string> ignored_paths;
  std::vector<std::string> enrichers;
  std::optional<std::size_t> max_iterations;
  std::optional<std::size_t> max_trace_hops;
  std::optional<std::size_t> jobs;
  std::optional<std::size_t> lock_timeout_ms;
  std::optional<LogLevel> log_level;
  bool force = false;
  bool show_help = false;
};

AnalyzeOptions ParseAnalyzeArguments(const std::vector<std::string> &arguments);
AnalyzeOptions ParseConfigFile(const std::filesystem::path &path);
// Values given on the command line override those of the config file.
AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options);
AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options);

const std::vector<std::string> &SupportedConfigKeys();
std::string NormalizeConfigKey(std::string key);

AnalysisConfig BuildAnalysisConfig(const AnalyzeOptions &options,
                                   const std::filesystem::path &root);
void WriteReports(const std::filesystem::path &directory, const Report &report);

int RunAnalyze(const std::vector<std::string> &arguments);
void PrintAnalyzeUsage();

} // namespace jsgraph
