#include <jsgraph/imported_call_resolver.h>

#include <jsgraph/module_resolver.h>
#include <jsgraph/node_factory.h>

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace jsgraph {
namespace {

struct ResolvedExport {
  std::string export_id;
  std::optional<std::string> function_id;
  std::optional<std::string> class_id;
};

class ExportTable {
public:
  explicit ExportTable(const GraphBackend &graph)
      : resolver_(CollectModules(graph)) {
    for (const auto &node : graph.QueryNodes({NodeType::kExport, {}, {}})) {
      if (const auto *attributes = node.AsExport()) {
        exports_[node.file].push_back({node.id, node.name, *attributes});
      }
    }
    for (const auto &node : graph.QueryNodes({NodeType::kFunction, {}, {}})) {
      functions_.insert(node.id);
    }
    for (const auto &node : graph.QueryNodes({NodeType::kClass, {}, {}})) {
      classes_.insert(node.id);
    }
  }

  std::optional<std::string> ResolveModule(const std::string &importer,
                                           const std::string &source) const {
    return resolver_.Resolve(importer, source);
  }

  std::optional<ResolvedExport> Find(const std::string &file,
                                     const std::string &name) const {
    std::unordered_set<std::string> visited;
    return Find(file, name, visited);
  }

private:
  struct ExportEntry {
    std::string id;
    std::string exported;
    ExportAttributes attributes;
  };

  static std::set<std::string> CollectModules(const GraphBackend &graph) {
    std::set<std::string> modules;
    for (const auto &node : graph.QueryNodes({NodeType::kModule, {}, {}})) {
      modules.insert(node.file);
    }
    return modules;
  }

  std::optional<ResolvedExport>
  Find(const std::string &file, const std::string &name,
       std::unordered_set<std::string> &visited) const {
    if (!visited.insert(file + "\n" + name).second) {
      return std::nullopt;
    }
    const auto entries = exports_.find(file);
    if (entries == exports_.end()) {
      return std::nullopt;
    }

    for (const auto &entry : entries->second) {
      if (entry.exported != name) {
        continue;
      }
      ResolvedExport resolved{entry.id, std::nullopt, std::nullopt};
      if (!entry.attributes.source.empty()) {
        if (const auto target = resolver_.Resolve(file, entry.attributes.source)) {
          if (const auto inner = Find(*target, entry.attributes.local, visited)) {
            resolved.function_id = inner->function_id;
            resolved.class_id = inner->class_id;
          }
        }
        return resolved;
      }
      if (!entry.attributes.local.empty()) {
        const ScopeContext scope{file, {}};
        const auto function_id =
            NodeFactory::FunctionReferenceId(entry.attributes.local, scope);
        if (functions_.count(function_id) > 0) {
          resolved.function_id = function_id;
        }
        const auto class_id =
            NodeFactory::ClassReferenceId(entry.attributes.local, scope);
        if (classes_.count(class_id) > 0) {
          resolved.class_id = class_id;
        }
      }
      return resolved;
    }

    // `export * from` forwards every name except default.
    if (name == "default") {
      return std::nullopt;
    }
    for (const auto &entry : entries->second) {
      if (entry.exported != "*" || entry.attributes.source.empty()) {
        continue;
      }
      if (const auto target = resolver_.Resolve(file, entry.attributes.source)) {
        if (auto inner = Find(*target, name, visited)) {
          return inner;
        }
      }
    }
    return std::nullopt;
  }

  RelativeModuleResolver resolver_;
  std::unordered_map<std::string, std::vector<ExportEntry>> exports_;
  std::unordered_set<std::string> functions_;
  std::unordered_set<std::string> classes_;
};

// A class name as written in one file, looked up through that file's imports.
struct ImportedClass {
  // False when the name is not bound by an import of the file.
  bool is_import = false;
  std::optional<std::string> class_id;
};

} // namespace

ImportedCallResolver::ImportedCallResolver(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

EnrichmentResult ImportedCallResolver::Enrich(GraphBackend &graph) {
  EnrichmentResult result;
  result.enricher = Name();
  result.iterations = 1;

  const ExportTable table(graph);
  // (file, local name) -> resolution of that import.
  std::map<std::pair<std::string, std::string>, std::optional<ResolvedExport>>
      imports;
  std::map<std::pair<std::string, std::string>, ImportAttributes> namespaces;
  std::vector<EdgeRecord> edges;

  for (const auto &node : graph.QueryNodes({NodeType::kImport, {}, {}})) {
    const auto *attributes = node.AsImport();
    if (attributes == nullptr) {
      continue;
    }
    const auto key = std::make_pair(node.file, attributes->local);
    if (attributes->imported == "*") {
      namespaces.emplace(key, *attributes);
      continue;
    }
    std::optional<ResolvedExport> resolved;
    if (const auto target =
            table.ResolveModule(node.file, attributes->source)) {
      resolved = table.Find(*target, attributes->imported);
    }
    if (resolved) {
      edges.push_back(
          {EdgeType::kImportsFrom, node.id, resolved->export_id, {}});
    }
    imports.emplace(key, std::move(resolved));
  }

  for (const auto &node : graph.QueryNodes({NodeType::kCall, {}, {}})) {
    const auto *attributes = node.AsCall();
    if (attributes == nullptr ||
        !graph.GetOutgoingEdges(node.id, {EdgeType::kCalls}).empty()) {
      continue;
    }
    std::optional<std::string> function_id;
    if (attributes->object.empty()) {
      const auto found = imports.find({node.file, node.name});
      if (found != imports.end() && found->second) {
        function_id = found->second->function_id;
      }
    } else {
      const auto found = namespaces.find({node.file, attributes->object});
      if (found != namespaces.end()) {
        if (const auto target =
                table.ResolveModule(node.file, found->second.source)) {
          if (const auto resolved = table.Find(*target, attributes->method)) {
            function_id = resolved->function_id;
          }
        }
      }
    }
    if (function_id) {
      edges.push_back({EdgeType::kCalls,
                       node.id,
                       *function_id,
                       {{"resolvedVia", "import"}}});
    }
  }

  std::set<std::pair<std::string, std::string>> local_classes;
  const auto class_nodes = graph.QueryNodes({NodeType::kClass, {}, {}});
  for (const auto &node : class_nodes) {
    local_classes.emplace(node.file, node.name);
  }

  // Classes declared in the file itself were linked by the graph builder.
  const auto lookup_class = [&](const std::string &file,
                                const std::string &name) {
    ImportedClass found;
    if (name.empty() || local_classes.count({file, name}) > 0) {
      return found;
    }
    const auto dot = name.find('.');
    if (dot == std::string::npos) {
      const auto import = imports.find({file, name});
      if (import != imports.end()) {
        found.is_import = true;
        if (import->second) {
          found.class_id = import->second->class_id;
        }
      }
      return found;
    }
    const auto member = name.substr(dot + 1);
    const auto import = namespaces.find({file, name.substr(0, dot)});
    if (import == namespaces.end() || member.empty() ||
        member.find('.') != std::string::npos) {
      return found;
    }
    found.is_import = true;
    if (const auto target = table.ResolveModule(file, import->second.source)) {
      if (const auto resolved = table.Find(*target, member)) {
        found.class_id = resolved->class_id;
      }
    }
    return found;
  };

  std::size_t builtin_errors = 0;
  for (auto &node : graph.QueryNodes({NodeType::kFunction, {}, {}})) {
    auto *attributes = node.AsFunction();
    if (attributes == nullptr) {
      continue;
    }
    bool updated = false;
    for (const auto &pattern : attributes->rejection_patterns) {
      if (!pattern.error_class_name) {
        continue;
      }
      const auto &class_name = *pattern.error_class_name;
      const auto found = lookup_class(node.file, class_name);
      if (!found.is_import) {
        continue;
      }
      if (found.class_id) {
        edges.push_back(
            {pattern.is_async ? EdgeType::kRejects : EdgeType::kThrows,
             node.id,
             *found.class_id,
             {{"rejectionType", ToString(pattern.rejection_type)},
              {"line", std::to_string(pattern.line)},
              {"resolvedVia", "import"}}});
        continue;
      }
      auto &control_flow = attributes->control_flow;
      auto &builtins = pattern.is_async ? control_flow.rejected_builtin_errors
                                        : control_flow.thrown_builtin_errors;
      if (std::find(builtins.begin(), builtins.end(), class_name) ==
          builtins.end()) {
        builtins.push_back(class_name);
        updated = true;
        ++builtin_errors;
      }
    }
    if (updated) {
      graph.AddNode(node);
    }
  }

  for (const auto &node : class_nodes) {
    const auto *attributes = node.AsClass();
    if (attributes == nullptr) {
      continue;
    }
    const auto found = lookup_class(node.file, attributes->super_class);
    if (found.class_id && *found.class_id != node.id) {
      edges.push_back({EdgeType::kDerivesFrom,
                       node.id,
                       *found.class_id,
                       {{"resolvedVia", "import"}}});
    }
  }

  for (const auto &variable :
       graph.QueryNodes({NodeType::kVariable, {}, {}})) {
    for (const auto &assignment :
         graph.GetOutgoingEdges(variable.id, {EdgeType::kAssignedFrom})) {
      const auto source = graph.GetNode(assignment.dst);
      if (!source || source->type != NodeType::kConstructorCall) {
        continue;
      }
      const auto *construction =
          std::get_if<ConstructorCallAttributes>(&source->attributes);
      if (construction == nullptr) {
        continue;
      }
      const auto found = lookup_class(variable.file, construction->class_name);
      if (found.class_id) {
        edges.push_back({EdgeType::kInstanceOf,
                         variable.id,
                         *found.class_id,
                         {{"resolvedVia", "import"}}});
      }
    }
  }

  result.edges_created = graph.AddEdges(edges, true).written;
  logger_->Log(LogLevel::kInfo, "enrichment.complete",
               {{"enricher", result.enricher},
                {"edges_created", std::to_string(result.edges_created)},
                {"builtin_errors", std::to_string(builtin_errors)},
                {"iterations", "1"},
                {"converged", "true"}});
  return result;
}

} // namespace jsgraph
