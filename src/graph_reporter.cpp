#include <jsgraph/graph_reporter.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <type_traits>
#include <unordered_map>

namespace jsgraph {
namespace {

template <typename Collection, typename Formatter>
std::string Join(const Collection &items, const std::string &delimiter,
                 Formatter formatter) {
  std::ostringstream output;
  bool first = true;
  std::for_each(items.begin(), items.end(), [&](const auto &item) {
    if (!first) {
      output << delimiter;
    }
    output << formatter(item);
    first = false;
  });
  return output.str();
}

std::string Quote(const std::string &value) {
  return "\"" + EscapeJsonString(value) + "\"";
}

std::string JoinJsonArray(const std::vector<std::string> &values) {
  return Join(values, ",", Quote);
}

std::string Bool(bool value) { return value ? "true" : "false"; }

bool ShouldRenderFormat(const std::vector<std::string> &formats,
                        const std::string &format) {
  if (formats.empty()) {
    return format == "markdown";
  }
  return std::find(formats.begin(), formats.end(), format) != formats.end();
}

std::string BuildAnalysisHeaderMarkdown(const AnalysisResult &result,
                                        const AnalysisConfig &config,
                                        const std::string &timestamp) {
  std::ostringstream section;
  section << "## Analysis Header\n\n";
  section << "| Field | Value |\n";
  section << "| --- | --- |\n";
  section << "| Generated On | " << timestamp << " |\n";
  section << "| Source | "
          << (result.project_root.empty() ? config.root_path
                                          : result.project_root)
          << " |\n";
  section << "| Files Analyzed | " << result.files_analyzed << " |\n";
  section << "| Files Failed | " << result.failures.size() << " |\n";
  section << "| Cancelled | " << (result.cancelled ? "yes" : "no")
          << " |\n\n";
  return section.str();
}

template <typename Key>
std::string BuildCountsMarkdown(const std::string &title,
                                const std::string &column,
                                const std::map<Key, std::size_t> &counts) {
  std::ostringstream section;
  section << "## " << title << "\n\n";
  section << "| " << column << " | Count |\n";
  section << "| --- | --- |\n";
  if (counts.empty()) {
    section << "| None | 0 |\n\n";
    return section.str();
  }
  for (const auto &[type, count] : counts) {
    section << "| " << ToString(type) << " | " << count << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildEnrichmentMarkdown(const AnalysisResult &result) {
  std::ostringstream section;
  section << "## Enrichment\n\n";
  section << "| Enricher | Edges Created | Converged | Iterations |\n";
  section << "| --- | --- | --- | --- |\n";
  if (result.enrichments.empty()) {
    section << "| None | - | - | - |\n\n";
    return section.str();
  }
  for (const auto &enrichment : result.enrichments) {
    section << "| " << enrichment.enricher << " | " << enrichment.edges_created
            << " | " << (enrichment.converged ? "yes" : "no") << " | "
            << enrichment.iterations << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildFailuresMarkdown(const AnalysisResult &result) {
  std::ostringstream section;
  section << "## Parse Failures\n\n";
  if (result.failures.empty()) {
    section << "- None\n\n";
    return section.str();
  }
  for (const auto &failure : result.failures) {
    section << "- " << failure.file << ":" << failure.line << ":"
            << failure.column << " " << failure.message << "\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildWarningsMarkdown(const AnalysisResult &result) {
  std::ostringstream section;
  section << "## Warnings\n\n";
  if (result.warnings.empty()) {
    section << "- None\n";
    return section.str();
  }
  for (const auto &warning : result.warnings) {
    section << "- " << warning << "\n";
  }
  return section.str();
}

template <typename Key>
std::string BuildCountsJson(const std::string &name,
                            const std::map<Key, std::size_t> &counts) {
  return "\"" + name + "\": {" +
         Join(counts, ",",
              [](const auto &entry) {
                return Quote(ToString(entry.first)) + ": " +
                       std::to_string(entry.second);
              }) +
         "}";
}

std::string BuildSummaryJson(const AnalysisResult &result,
                             const AnalysisConfig &config,
                             const std::string &timestamp) {
  std::ostringstream json;
  json << "{";
  json << "\"analysis_header\": {";
  json << "\"generated_on\": " << Quote(timestamp) << ",";
  json << "\"source\": "
       << Quote(result.project_root.empty() ? config.root_path
                                            : result.project_root)
       << ",";
  json << "\"files_analyzed\": " << result.files_analyzed << ",";
  json << "\"cancelled\": " << Bool(result.cancelled) << "},";
  json << BuildCountsJson("nodes", result.statistics.nodes) << ",";
  json << BuildCountsJson("edges", result.statistics.edges) << ",";
  json << "\"enrichments\": ["
       << Join(result.enrichments, ",",
               [](const EnrichmentResult &enrichment) {
                 return "{\"enricher\": " + Quote(enrichment.enricher) +
                        ", \"edges_created\": " +
                        std::to_string(enrichment.edges_created) +
                        ", \"converged\": " + Bool(enrichment.converged) +
                        ", \"iterations\": " +
                        std::to_string(enrichment.iterations) + "}";
               })
       << "],";
  json << "\"failures\": ["
       << Join(result.failures, ",",
               [](const FileFailure &failure) {
                 return "{\"file\": " + Quote(failure.file) +
                        ", \"line\": " + std::to_string(failure.line) +
                        ", \"column\": " + std::to_string(failure.column) +
                        ", \"message\": " + Quote(failure.message) + "}";
               })
       << "],";
  json << "\"warnings\": [" << JoinJsonArray(result.warnings) << "]";
  json << "}";
  return json.str();
}

std::string PatternJson(const RejectionPattern &pattern) {
  std::ostringstream json;
  json << "{\"rejectionType\": " << Quote(ToString(pattern.rejection_type));
  json << ", \"errorClassName\": "
       << (pattern.error_class_name ? Quote(*pattern.error_class_name)
                                    : std::string("null"));
  json << ", \"line\": " << pattern.line << ", \"column\": " << pattern.column;
  json << ", \"isAsync\": " << Bool(pattern.is_async);
  if (!pattern.source_variable_name.empty()) {
    json << ", \"sourceVariableName\": "
         << Quote(pattern.source_variable_name);
  }
  if (!pattern.trace_path.empty()) {
    json << ", \"tracePath\": [" << JoinJsonArray(pattern.trace_path) << "]";
  }
  json << "}";
  return json.str();
}

std::string ControlFlowJson(const ControlFlowMetadata &control_flow) {
  std::ostringstream json;
  json << "{\"hasBranches\": " << Bool(control_flow.has_branches)
       << ", \"hasLoops\": " << Bool(control_flow.has_loops)
       << ", \"hasTryCatch\": " << Bool(control_flow.has_try_catch)
       << ", \"hasEarlyReturn\": " << Bool(control_flow.has_early_return)
       << ", \"hasThrow\": " << Bool(control_flow.has_throw)
       << ", \"hasAsyncThrow\": " << Bool(control_flow.has_async_throw)
       << ", \"canReject\": " << Bool(control_flow.can_reject)
       << ", \"cyclomaticComplexity\": " << control_flow.cyclomatic_complexity
       << ", \"rejectedBuiltinErrors\": ["
       << JoinJsonArray(control_flow.rejected_builtin_errors) << "]"
       << ", \"thrownBuiltinErrors\": ["
       << JoinJsonArray(control_flow.thrown_builtin_errors) << "]}";
  return json.str();
}

std::string AttributesJson(const NodeAttributes &attributes) {
  return std::visit(
      [](const auto &value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, FunctionAttributes>) {
          return "{\"async\": " + Bool(value.is_async) +
                 ", \"generator\": " + Bool(value.is_generator) +
                 ", \"arrowFunction\": " + Bool(value.is_arrow) +
                 ", \"method\": " + Bool(value.is_method) +
                 ", \"className\": " + Quote(value.class_name) +
                 ", \"parameters\": [" + JoinJsonArray(value.parameters) +
                 "], \"controlFlow\": " + ControlFlowJson(value.control_flow) +
                 ", \"rejectionPatterns\": [" +
                 Join(value.rejection_patterns, ",", PatternJson) + "]}";
        } else if constexpr (std::is_same_v<T, ClassAttributes>) {
          return "{\"superClass\": " + Quote(value.super_class) + "}";
        } else if constexpr (std::is_same_v<T, CallAttributes>) {
          return "{\"object\": " + Quote(value.object) +
                 ", \"method\": " + Quote(value.method) +
                 ", \"isMethodCall\": " + Bool(value.is_method_call) +
                 ", \"isAwaited\": " + Bool(value.is_awaited) +
                 ", \"isInsideTry\": " + Bool(value.is_inside_try) +
                 ", \"argumentCount\": " +
                 std::to_string(value.argument_count) + "}";
        } else if constexpr (std::is_same_v<T, ConstructorCallAttributes>) {
          return "{\"className\": " + Quote(value.class_name) +
                 ", \"argumentCount\": " +
                 std::to_string(value.argument_count) + "}";
        } else if constexpr (std::is_same_v<T, LiteralAttributes>) {
          return "{\"entryCount\": " + std::to_string(value.entry_count) + "}";
        } else if constexpr (std::is_same_v<T, VariableAttributes>) {
          return "{\"kind\": " + Quote(value.kind) + "}";
        } else if constexpr (std::is_same_v<T, ParameterAttributes>) {
          return "{\"index\": " + std::to_string(value.index) +
                 ", \"isRest\": " + Bool(value.is_rest) +
                 ", \"hasDefault\": " + Bool(value.has_default) + "}";
        } else if constexpr (std::is_same_v<T, BlockAttributes>) {
          return "{\"parameterName\": " + Quote(value.parameter_name) +
                 ", \"parentTryBlockId\": " +
                 Quote(value.parent_try_block_id) + "}";
        } else if constexpr (std::is_same_v<T, ImportAttributes>) {
          return "{\"source\": " + Quote(value.source) +
                 ", \"imported\": " + Quote(value.imported) +
                 ", \"local\": " + Quote(value.local) + "}";
        } else if constexpr (std::is_same_v<T, ExportAttributes>) {
          return "{\"exported\": " + Quote(value.exported) +
                 ", \"local\": " + Quote(value.local) +
                 ", \"source\": " + Quote(value.source) +
                 ", \"isDefault\": " + Bool(value.is_default) + "}";
        } else {
          return "{}";
        }
      },
      attributes);
}

std::string NodeJson(const NodeRecord &node) {
  return "{\"id\": " + Quote(node.id) + ", \"type\": " +
         Quote(ToString(node.type)) + ", \"name\": " + Quote(node.name) +
         ", \"file\": " + Quote(node.file) +
         ", \"line\": " + std::to_string(node.line) +
         ", \"column\": " + std::to_string(node.column) +
         ", \"attributes\": " + AttributesJson(node.attributes) + "}";
}

std::string EdgeJson(const EdgeRecord &edge) {
  return "{\"type\": " + Quote(ToString(edge.type)) +
         ", \"src\": " + Quote(edge.src) + ", \"dst\": " + Quote(edge.dst) +
         ", \"metadata\": {" +
         Join(edge.metadata, ",",
              [](const auto &entry) {
                return Quote(entry.first) + ": " + Quote(entry.second);
              }) +
         "}}";
}

} // namespace

std::string EscapeJsonString(const std::string &value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""},
      {'\\', "\\\\"},
      {'\n', "\\n"},
      {'\r', "\\r"},
      {'\t', "\\t"}};

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
    } else if (static_cast<unsigned char>(character) < 0x20) {
      char buffer[8];
      std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                    static_cast<unsigned>(character));
      escaped.append(buffer);
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::string RenderGraphJson(const GraphBackend &graph) {
  std::ostringstream json;
  json << "{\"nodes\": [" << Join(graph.QueryNodes({}), ",", NodeJson) << "],";
  json << "\"edges\": [" << Join(graph.QueryEdges({}), ",", EdgeJson) << "]}";
  return json.str();
}

Report GraphReporter::Render(const AnalysisResult &result,
                             const GraphBackend &graph,
                             const AnalysisConfig &config) {
  const auto now = std::chrono::system_clock::now();
  const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  std::ostringstream timestamp_stream;
  timestamp_stream << std::put_time(std::gmtime(&now_time), "%FT%TZ");
  const auto timestamp = timestamp_stream.str();

  Report report;
  if (ShouldRenderFormat(config.formats, "markdown")) {
    std::ostringstream output;
    output << "# JavaScript Graph Analysis Report\n\n";
    output << BuildAnalysisHeaderMarkdown(result, config, timestamp);
    output << BuildCountsMarkdown("Nodes", "Type", result.statistics.nodes);
    output << BuildCountsMarkdown("Edges", "Type", result.statistics.edges);
    output << BuildEnrichmentMarkdown(result);
    output << BuildFailuresMarkdown(result);
    output << BuildWarningsMarkdown(result);
    report.markdown = output.str();
  }
  if (ShouldRenderFormat(config.formats, "json")) {
    report.json = BuildSummaryJson(result, config, timestamp);
  }
  if (ShouldRenderFormat(config.formats, "graph")) {
    report.graph_json = RenderGraphJson(graph);
  }
  return report;
}

} // namespace jsgraph
