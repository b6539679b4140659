#include <jsgraph/graph.h>

#include <utility>

namespace jsgraph {
namespace {
const std::vector<std::pair<NodeType, std::string>> &NodeTypeNames() {
  static const std::vector<std::pair<NodeType, std::string>> names = {
      {NodeType::kModule, "MODULE"},
      {NodeType::kFunction, "FUNCTION"},
      {NodeType::kClass, "CLASS"},
      {NodeType::kCall, "CALL"},
      {NodeType::kConstructorCall, "CONSTRUCTOR_CALL"},
      {NodeType::kObjectLiteral, "OBJECT_LITERAL"},
      {NodeType::kArrayLiteral, "ARRAY_LITERAL"},
      {NodeType::kVariable, "VARIABLE"},
      {NodeType::kParameter, "PARAMETER"},
      {NodeType::kTryBlock, "TRY_BLOCK"},
      {NodeType::kCatchBlock, "CATCH_BLOCK"},
      {NodeType::kFinallyBlock, "FINALLY_BLOCK"},
      {NodeType::kImport, "IMPORT"},
      {NodeType::kExport, "EXPORT"}};
  return names;
}

const std::vector<std::pair<EdgeType, std::string>> &EdgeTypeNames() {
  static const std::vector<std::pair<EdgeType, std::string>> names = {
      {EdgeType::kContains, "CONTAINS"},
      {EdgeType::kCalls, "CALLS"},
      {EdgeType::kDerivesFrom, "DERIVES_FROM"},
      {EdgeType::kInstanceOf, "INSTANCE_OF"},
      {EdgeType::kResolvesTo, "RESOLVES_TO"},
      {EdgeType::kRejects, "REJECTS"},
      {EdgeType::kThrows, "THROWS"},
      {EdgeType::kCatchesFrom, "CATCHES_FROM"},
      {EdgeType::kAssignedFrom, "ASSIGNED_FROM"},
      {EdgeType::kHasCatch, "HAS_CATCH"},
      {EdgeType::kHasFinally, "HAS_FINALLY"},
      {EdgeType::kImportsFrom, "IMPORTS_FROM"}};
  return names;
}

template <typename Enum>
std::string
LookupName(const std::vector<std::pair<Enum, std::string>> &names,
           Enum value) {
  for (const auto &[candidate, name] : names) {
    if (candidate == value) {
      return name;
    }
  }
  return "UNKNOWN";
}

template <typename Enum>
std::optional<Enum>
LookupValue(const std::vector<std::pair<Enum, std::string>> &names,
            const std::string &value) {
  for (const auto &[candidate, name] : names) {
    if (name == value) {
      return candidate;
    }
  }
  return std::nullopt;
}

template <typename Enum>
std::vector<Enum>
CollectValues(const std::vector<std::pair<Enum, std::string>> &names) {
  std::vector<Enum> values;
  values.reserve(names.size());
  for (const auto &entry : names) {
    values.push_back(entry.first);
  }
  return values;
}
} // namespace

std::string ToString(NodeType type) {
  return LookupName(NodeTypeNames(), type);
}

std::string ToString(EdgeType type) {
  return LookupName(EdgeTypeNames(), type);
}

std::optional<NodeType> ParseNodeType(const std::string &value) {
  return LookupValue(NodeTypeNames(), value);
}

std::optional<EdgeType> ParseEdgeType(const std::string &value) {
  return LookupValue(EdgeTypeNames(), value);
}

const std::vector<NodeType> &AllNodeTypes() {
  static const std::vector<NodeType> types = CollectValues(NodeTypeNames());
  return types;
}

const std::vector<EdgeType> &AllEdgeTypes() {
  static const std::vector<EdgeType> types = CollectValues(EdgeTypeNames());
  return types;
}

std::string ToString(RejectionType type) {
  switch (type) {
  case RejectionType::kDirectConstructInRejectCall:
    return "direct-construct-in-reject-call";
  case RejectionType::kDirectConstructInStaticReject:
    return "direct-construct-in-static-reject";
  case RejectionType::kDirectConstructInAsyncThrow:
    return "direct-construct-in-async-throw";
  case RejectionType::kDirectConstructInSyncThrow:
    return "direct-construct-in-sync-throw";
  case RejectionType::kTracedLocalVariable:
    return "traced-local-variable";
  case RejectionType::kUnresolvedParameter:
    return "unresolved-parameter";
  case RejectionType::kUnresolvedVariable:
    return "unresolved-variable";
  }
  return "unknown";
}

} // namespace jsgraph
