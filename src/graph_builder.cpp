#include <jsgraph/graph_builder.h>

#include <jsgraph/node_factory.h>

#include <algorithm>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace jsgraph {
namespace {

// Lookup tables over one file's declarations, built once per Build call.
class FileIndex {
public:
  explicit FileIndex(const FileCollections &collections)
      : file_(collections.file) {
    for (const auto &function : collections.functions) {
      function_ids_.insert(function.id);
    }
    for (const auto &declaration : collections.class_declarations) {
      class_ids_.insert(declaration.class_id);
      class_by_name_.emplace(declaration.name, declaration.class_id);
    }
    for (const auto &import : collections.imports) {
      if (const auto *attributes = import.AsImport()) {
        imports_.emplace(attributes->local, *attributes);
      }
    }
  }

  std::optional<std::string>
  ResolveFunction(const CallSiteInfo &site) const {
    if (site.is_this_call) {
      const auto id = NodeFactory::FunctionReferenceId(
          site.callee, ScopeContext{file_, site.class_scope_path});
      if (function_ids_.count(id) > 0) {
        return id;
      }
      return std::nullopt;
    }
    for (auto depth = site.scope_path.size() + 1; depth-- > 0;) {
      const std::vector<std::string> prefix(site.scope_path.begin(),
                                            site.scope_path.begin() + depth);
      const auto id = NodeFactory::FunctionReferenceId(
          site.callee, ScopeContext{file_, prefix});
      if (function_ids_.count(id) > 0) {
        return id;
      }
    }
    return std::nullopt;
  }

  // Lexical lookup from `scope_path` outward, then any class of the file
  // with that name.
  std::optional<std::string>
  ResolveClass(const std::string &name,
               const std::vector<std::string> &scope_path) const {
    for (auto depth = scope_path.size() + 1; depth-- > 0;) {
      const std::vector<std::string> prefix(scope_path.begin(),
                                            scope_path.begin() + depth);
      const auto id =
          NodeFactory::ClassReferenceId(name, ScopeContext{file_, prefix});
      if (class_ids_.count(id) > 0) {
        return id;
      }
    }
    return ResolveErrorClass(name);
  }

  std::optional<std::string> ResolveErrorClass(const std::string &name) const {
    const auto local = class_by_name_.find(name);
    if (local != class_by_name_.end()) {
      return local->second;
    }
    return std::nullopt;
  }

  // `Name` bound by a default or named import, or `ns.Name` through a
  // namespace import. The imported-calls enricher resolves these once every
  // file of the batch is in the graph.
  bool IsImportedName(const std::string &name) const {
    const auto dot = name.find('.');
    if (dot == std::string::npos) {
      const auto import = imports_.find(name);
      return import != imports_.end() && import->second.imported != "*";
    }
    const auto import = imports_.find(name.substr(0, dot));
    const auto member = name.substr(dot + 1);
    return import != imports_.end() && import->second.imported == "*" &&
           !member.empty() && member.find('.') == std::string::npos;
  }

private:
  std::string file_;
  std::unordered_set<std::string> function_ids_;
  std::unordered_set<std::string> class_ids_;
  std::unordered_map<std::string, std::string> class_by_name_;
  std::unordered_map<std::string, ImportAttributes> imports_;
};

void AppendUnique(std::vector<std::string> &values, const std::string &value) {
  if (std::find(values.begin(), values.end(), value) == values.end()) {
    values.push_back(value);
  }
}

void AppendNodes(std::vector<NodeRecord> &nodes,
                 const std::vector<NodeRecord> &source) {
  nodes.insert(nodes.end(), source.begin(), source.end());
}

} // namespace

GraphBuilder::GraphBuilder(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

GraphBuildResult GraphBuilder::Build(const FileCollections &collections,
                                     GraphBackend &graph) const {
  const FileIndex index(collections);
  GraphBuildResult result;

  auto functions = collections.functions;
  std::unordered_map<std::string, std::size_t> function_positions;
  for (std::size_t i = 0; i < functions.size(); ++i) {
    function_positions.emplace(functions[i].id, i);
  }

  std::vector<EdgeRecord> edges;
  for (const auto &containment : collections.containment) {
    edges.push_back(
        {EdgeType::kContains, containment.parent_id, containment.child_id, {}});
  }

  for (const auto &site : collections.call_sites) {
    if (const auto target = index.ResolveFunction(site)) {
      edges.push_back({EdgeType::kCalls, site.call_id, *target, {}});
    }
  }

  for (const auto &declaration : collections.class_declarations) {
    if (declaration.super_class.empty()) {
      continue;
    }
    if (const auto target =
            index.ResolveClass(declaration.super_class, declaration.scope_path)) {
      if (*target != declaration.class_id) {
        edges.push_back(
            {EdgeType::kDerivesFrom, declaration.class_id, *target, {}});
      }
    }
  }

  for (const auto &pattern : collections.rejection_patterns) {
    const auto position = function_positions.find(pattern.function_id);
    if (position == function_positions.end()) {
      continue;
    }
    auto *attributes = functions[position->second].AsFunction();
    attributes->rejection_patterns.push_back(pattern);
    if (!pattern.error_class_name) {
      continue;
    }
    const auto &class_name = *pattern.error_class_name;
    if (const auto target = index.ResolveErrorClass(class_name)) {
      edges.push_back(
          {pattern.is_async ? EdgeType::kRejects : EdgeType::kThrows,
           pattern.function_id,
           *target,
           {{"rejectionType", ToString(pattern.rejection_type)},
            {"line", std::to_string(pattern.line)}}});
      continue;
    }
    if (index.IsImportedName(class_name)) {
      continue;
    }
    auto &control_flow = attributes->control_flow;
    AppendUnique(pattern.is_async ? control_flow.rejected_builtin_errors
                                  : control_flow.thrown_builtin_errors,
                 class_name);
    ++result.builtin_errors;
  }

  for (const auto &catches : collections.catches_from) {
    edges.push_back({EdgeType::kCatchesFrom,
                     catches.catch_block_id,
                     catches.source_id,
                     {{"parameterName", catches.parameter_name},
                      {"sourceType", ToString(catches.source_type)},
                      {"sourceLine", std::to_string(catches.source_line)}}});
  }

  for (const auto &settlement : collections.promise_settlements) {
    edges.push_back({EdgeType::kResolvesTo,
                     settlement.call_id,
                     settlement.promise_id,
                     {{"kind", settlement.is_reject ? "reject" : "resolve"}}});
  }

  for (const auto &assignment : collections.assignments) {
    edges.push_back({EdgeType::kAssignedFrom,
                     assignment.variable_id,
                     assignment.source_id,
                     {}});
  }

  for (const auto &instantiation : collections.instantiations) {
    if (const auto target = index.ResolveClass(instantiation.class_name,
                                               instantiation.scope_path)) {
      edges.push_back(
          {EdgeType::kInstanceOf, instantiation.variable_id, *target, {}});
    }
  }

  for (const auto &block : collections.blocks) {
    const auto *attributes = block.AsBlock();
    if (attributes == nullptr || attributes->parent_try_block_id.empty()) {
      continue;
    }
    edges.push_back({block.type == NodeType::kCatchBlock ? EdgeType::kHasCatch
                                                         : EdgeType::kHasFinally,
                     attributes->parent_try_block_id,
                     block.id,
                     {}});
  }

  std::vector<NodeRecord> nodes;
  nodes.reserve(collections.NodeCount());
  nodes.push_back(collections.module);
  AppendNodes(nodes, functions);
  AppendNodes(nodes, collections.classes);
  AppendNodes(nodes, collections.calls);
  AppendNodes(nodes, collections.constructor_calls);
  AppendNodes(nodes, collections.literals);
  AppendNodes(nodes, collections.variables);
  AppendNodes(nodes, collections.parameters);
  AppendNodes(nodes, collections.blocks);
  AppendNodes(nodes, collections.imports);
  AppendNodes(nodes, collections.exports);

  const auto node_result = graph.AddNodes(nodes);
  const auto edge_result = graph.AddEdges(edges, true);
  result.nodes = node_result.written;
  result.edges = edge_result.written;

  logger_->Log(LogLevel::kDebug, "graph_builder.file.complete",
               {{"file", collections.file},
                {"nodes", std::to_string(result.nodes)},
                {"edges", std::to_string(result.edges)},
                {"builtin_errors", std::to_string(result.builtin_errors)}});
  return result;
}

} // namespace jsgraph
