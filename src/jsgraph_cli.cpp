#include <jsgraph/jsgraph_cli.h>

#include <jsgraph/analysis_coordinator.h>
#include <jsgraph/analyzer_pipeline_builder.h>
#include <jsgraph/cli_exit_codes.h>
#include <jsgraph/default_analyzer_pipeline.h>
#include <jsgraph/in_memory_graph_backend.h>
#include <jsgraph/js_source_acquirer.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <variant>

#include <yaml-cpp/yaml.h>

namespace jsgraph {

namespace {

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw_values) {
    if (character == ',') {
      values.push_back(Trim(current));
      current.clear();
    } else {
      current.push_back(character);
    }
  }
  values.push_back(Trim(current));
  values.erase(std::remove(values.begin(), values.end(), std::string{}),
               values.end());
  return values;
}

void AppendUnique(std::string value, std::vector<std::string> &target) {
  if (std::find(target.begin(), target.end(), value) == target.end()) {
    target.push_back(std::move(value));
  }
}

void AppendFormats(const std::string &raw_formats,
                   std::vector<std::string> &target) {
  for (auto format : SplitList(raw_formats)) {
    format = ToLower(format);
    if (format != "markdown" && format != "json" && format != "graph") {
      throw std::invalid_argument("Unsupported format: " + format +
                                  " (supported: markdown,json,graph)");
    }
    AppendUnique(std::move(format), target);
  }
}

void AppendExtensions(const std::string &raw_extensions,
                      std::vector<std::string> &target) {
  for (auto extension : SplitList(raw_extensions)) {
    extension = ToLower(extension);
    if (extension.front() != '.') {
      extension.insert(extension.begin(), '.');
    }
    AppendUnique(std::move(extension), target);
  }
}

void AppendNames(const std::string &raw_names,
                 std::vector<std::string> &target) {
  for (auto name : SplitList(raw_names)) {
    AppendUnique(ToLower(name), target);
  }
}

void AppendRawPathStrings(const std::string &raw_paths,
                          std::vector<std::string> &target) {
  for (const auto &path_value : SplitList(raw_paths)) {
    AppendUnique(std::filesystem::path(path_value).generic_string(), target);
  }
}

std::size_t ParseCount(const std::string &raw_value, const std::string &name,
                       std::size_t minimum) {
  const auto value = Trim(raw_value);
  if (value.empty() ||
      !std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
      })) {
    throw std::invalid_argument(name + " must be a non-negative integer, got '" +
                                raw_value + "'");
  }
  std::size_t parsed = 0;
  try {
    parsed = static_cast<std::size_t>(std::stoull(value));
  } catch (const std::out_of_range &) {
    throw std::invalid_argument(name + " is out of range: " + raw_value);
  }
  if (parsed < minimum) {
    throw std::invalid_argument(name + " must be at least " +
                                std::to_string(minimum));
  }
  return parsed;
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleListOption(const std::vector<std::string> &arguments,
                      std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--format") {
    AppendFormats(RequireValue(arguments, index, argument), options.formats);
    return true;
  }
  if (argument == "--extensions") {
    AppendExtensions(RequireValue(arguments, index, argument),
                     options.extensions);
    return true;
  }
  if (argument == "--ignored-paths") {
    AppendRawPathStrings(RequireValue(arguments, index, argument),
                         options.ignored_paths);
    return true;
  }
  if (argument == "--enrichers") {
    AppendNames(RequireValue(arguments, index, argument), options.enrichers);
    return true;
  }
  return false;
}

bool HandleNumericOption(const std::vector<std::string> &arguments,
                         std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--max-iterations") {
    options.max_iterations =
        ParseCount(RequireValue(arguments, index, argument), argument, 1);
    return true;
  }
  if (argument == "--max-trace-hops") {
    options.max_trace_hops =
        ParseCount(RequireValue(arguments, index, argument), argument, 1);
    return true;
  }
  if (argument == "--jobs") {
    options.jobs =
        ParseCount(RequireValue(arguments, index, argument), argument, 0);
    return true;
  }
  if (argument == "--lock-timeout-ms") {
    options.lock_timeout_ms =
        ParseCount(RequireValue(arguments, index, argument), argument, 1);
    return true;
  }
  return false;
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level = ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = LogLevel::kDebug;
    return true;
  }
  return false;
}

bool DispatchAnalyzeOption(const std::vector<std::string> &arguments,
                           std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--root") {
    options.root = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--out") {
    options.output_directory = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--force") {
    options.force = true;
    return true;
  }
  return HandleListOption(arguments, index, options) ||
         HandleNumericOption(arguments, index, options) ||
         HandleLoggingOption(arguments, index, options);
}

void ValidateAnalyzeOptions(const AnalyzeOptions &options) {
  if (!options.root) {
    throw std::invalid_argument("--root is required (or set in config file)");
  }
}

using ConfigValue = std::variant<std::string, std::vector<std::string>>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a scalar value");
  }
  return node.as<std::string>();
}

using ListAppender = void (*)(const std::string &, std::vector<std::string> &);

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name,
                                     ListAppender appender) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      appender(child.as<std::string>(), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    appender(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

ListAppender ListAppenderFor(const std::string &key) {
  if (key == "formats") {
    return AppendFormats;
  }
  if (key == "extensions") {
    return AppendExtensions;
  }
  if (key == "ignored_paths") {
    return AppendRawPathStrings;
  }
  if (key == "enrichers") {
    return AppendNames;
  }
  return nullptr;
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (const auto appender = ListAppenderFor(key)) {
    return ExtractList(node, key, appender);
  }
  return ExtractStringScalar(node, key);
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception &error) {
    throw std::invalid_argument("Failed to parse config file " +
                                path.string() + ": " + error.what());
  }
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyConfig(const RawConfig &config, AnalyzeOptions &options) {
  for (const auto &[key, value] : config) {
    if (const auto *list = std::get_if<std::vector<std::string>>(&value)) {
      if (key == "formats") {
        options.formats = *list;
      } else if (key == "extensions") {
        options.extensions = *list;
      } else if (key == "ignored_paths") {
        options.ignored_paths = *list;
      } else if (key == "enrichers") {
        options.enrichers = *list;
      }
      continue;
    }
    const auto &scalar = std::get<std::string>(value);
    if (key == "root") {
      options.root = scalar;
    } else if (key == "out") {
      options.output_directory = scalar;
    } else if (key == "max_iterations") {
      options.max_iterations = ParseCount(scalar, key, 1);
    } else if (key == "max_trace_hops") {
      options.max_trace_hops = ParseCount(scalar, key, 1);
    } else if (key == "jobs") {
      options.jobs = ParseCount(scalar, key, 0);
    } else if (key == "lock_timeout_ms") {
      options.lock_timeout_ms = ParseCount(scalar, key, 1);
    } else if (key == "log_level") {
      options.log_level = ParseLogLevel(scalar);
    } else {
      ThrowUnknownKey(key);
    }
  }
}

LoggingConfig BuildLoggingConfig(const AnalyzeOptions &options) {
  LoggingConfig logging;
  logging.level = options.log_level.value_or(LogLevel::kWarn);
  return logging;
}

void WriteFileIfContent(const std::filesystem::path &path,
                        const std::string &content) {
  if (content.empty()) {
    return;
  }
  std::ofstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
}

} // namespace

void PrintAnalyzeUsage() {
  std::cout
      << "Usage: jsgraph analyze --root <path> [options]\n"
      << "Options:\n"
      << "  --root <path>            Root directory of the JavaScript project\n"
      << "  --config <file>          Optional YAML config file\n"
      << "  --out <path>             Directory for report outputs (default: "
         "analysis root)\n"
      << "  --format <list>          Comma-separated output formats\n"
      << "                           (supported: markdown,json,graph)\n"
      << "  --extensions <list>      File extensions to analyze\n"
      << "  --ignored-paths <list>   Paths relative to --root to skip\n"
      << "  --enrichers <list>       Enrichment passes to run, in order\n"
      << "  --max-iterations <n>     Bound on enrichment rounds (default: 10)\n"
      << "  --max-trace-hops <n>     Bound on variable alias tracing "
         "(default: 5)\n"
      << "  --jobs <n>               Worker threads (default: hardware "
         "concurrency)\n"
      << "  --lock-timeout-ms <n>    Wait bound for a running analysis "
         "(default: 30000)\n"
      << "  --force                  Clear the graph and re-run\n"
      << "  --log-level <level>      Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose                Shortcut for --log-level info\n"
      << "  --debug                  Shortcut for --log-level debug\n"
      << "  --help                   Show this message\n";
}

AnalyzeOptions
ParseAnalyzeArguments(const std::vector<std::string> &arguments) {
  AnalyzeOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchAnalyzeOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }
  return options;
}

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {"root",
                                                "out",
                                                "formats",
                                                "extensions",
                                                "ignored_paths",
                                                "enrichers",
                                                "max_iterations",
                                                "max_trace_hops",
                                                "jobs",
                                                "lock_timeout_ms",
                                                "log_level"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"output", "out"},
      {"output_directory", "out"},
      {"format", "formats"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

AnalyzeOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  AnalyzeOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path), options);
  return options;
}

AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options) {
  AnalyzeOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };
  const auto override_list = [](auto &target, const auto &source) {
    if (!source.empty()) {
      target = source;
    }
  };

  override_value(merged.root, cli_options.root);
  override_value(merged.output_directory, cli_options.output_directory);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.max_iterations, cli_options.max_iterations);
  override_value(merged.max_trace_hops, cli_options.max_trace_hops);
  override_value(merged.jobs, cli_options.jobs);
  override_value(merged.lock_timeout_ms, cli_options.lock_timeout_ms);
  override_value(merged.log_level, cli_options.log_level);
  override_list(merged.formats, cli_options.formats);
  override_list(merged.extensions, cli_options.extensions);
  override_list(merged.ignored_paths, cli_options.ignored_paths);
  override_list(merged.enrichers, cli_options.enrichers);
  merged.force = config_options.force || cli_options.force;
  merged.show_help = cli_options.show_help;
  return merged;
}

AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  AnalyzeOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }

  const auto merged = MergeOptions(config_options, cli_options);
  ValidateAnalyzeOptions(merged);
  return merged;
}

AnalysisConfig BuildAnalysisConfig(const AnalyzeOptions &options,
                                   const std::filesystem::path &root) {
  AnalysisConfig config;
  config.root_path = root.string();
  config.formats = options.formats.empty()
                       ? std::vector<std::string>{"markdown"}
                       : options.formats;
  config.extensions = options.extensions;
  config.enrichers = options.enrichers;
  config.max_iterations = options.max_iterations.value_or(kDefaultMaxIterations);
  config.max_trace_hops = options.max_trace_hops.value_or(config.max_trace_hops);
  config.jobs = options.jobs.value_or(0);
  for (const auto &ignored : options.ignored_paths) {
    std::filesystem::path path(ignored);
    if (!path.is_absolute()) {
      path = root / path;
    }
    config.ignored_paths.push_back(
        std::filesystem::weakly_canonical(path).generic_string());
  }
  return config;
}

void WriteReports(const std::filesystem::path &directory,
                  const Report &report) {
  std::filesystem::create_directories(directory);
  WriteFileIfContent(directory / "jsgraph_report.md", report.markdown);
  WriteFileIfContent(directory / "jsgraph_report.json", report.json);
  WriteFileIfContent(directory / "jsgraph_graph.json", report.graph_json);
}

int RunAnalyze(const std::vector<std::string> &arguments) {
  const auto cli_options = ParseAnalyzeArguments(arguments);
  if (cli_options.show_help) {
    PrintAnalyzeUsage();
    return kExitSuccess;
  }

  const auto merged = ResolveAnalyzeOptions(cli_options);
  const auto root = std::filesystem::weakly_canonical(*merged.root);
  auto logger = MakeLogger(BuildLoggingConfig(merged), std::clog);

  auto graph = std::make_shared<InMemoryGraphBackend>();
  AnalyzerPipelineBuilder builder;
  builder.WithLogger(logger)
      .WithSourceAcquirer(std::make_unique<JsSourceAcquirer>(logger))
      .WithGraph(graph);
  auto pipeline = std::make_shared<DefaultAnalyzerPipeline>(builder.Build());

  CoordinatorOptions coordinator_options;
  coordinator_options.lock_timeout = std::chrono::milliseconds(
      merged.lock_timeout_ms.value_or(kDefaultLockTimeout.count()));
  coordinator_options.logger = logger;
  AnalysisCoordinator coordinator(graph, pipeline, coordinator_options);

  const auto result =
      coordinator.Analyze(BuildAnalysisConfig(merged, root), merged.force);
  WriteReports(merged.output_directory.value_or(root), result.report);
  return AnalysisExitCode(result);
}

} // namespace jsgraph
