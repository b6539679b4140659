#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace jsgraph {

enum class NodeType {
  kModule,
  kFunction,
  kClass,
  kCall,
  kConstructorCall,
  kObjectLiteral,
  kArrayLiteral,
  kVariable,
  kParameter,
  kTryBlock,
  kCatchBlock,
  kFinallyBlock,
  kImport,
  kExport,
};

enum class EdgeType {
  kContains,
  kCalls,
  kDerivesFrom,
  kInstanceOf,
  kResolvesTo,
  kRejects,
  kThrows,
  kCatchesFrom,
  kAssignedFrom,
  kHasCatch,
  kHasFinally,
  kImportsFrom,
};

std::string ToString(NodeType type);
std::string ToString(EdgeType type);
std::optional<NodeType> ParseNodeType(const std::string &value);
std::optional<EdgeType> ParseEdgeType(const std::string &value);
const std::vector<NodeType> &AllNodeTypes();
const std::vector<EdgeType> &AllEdgeTypes();

enum class RejectionType {
  kDirectConstructInRejectCall,
  kDirectConstructInStaticReject,
  kDirectConstructInAsyncThrow,
  kDirectConstructInSyncThrow,
  kTracedLocalVariable,
  kUnresolvedParameter,
  kUnresolvedVariable,
};

std::string ToString(RejectionType type);

// An error-producing site found inside one function body. Asynchronous
// patterns (rejections, throws inside async functions) have is_async set.
struct RejectionPattern {
  std::string function_id;
  std::optional<std::string> error_class_name;
  RejectionType rejection_type = RejectionType::kUnresolvedVariable;
  bool is_async = true;
  std::string file;
  int line = 0;
  int column = 0;
  std::string source_variable_name;
  std::vector<std::string> trace_path;
};

struct ControlFlowMetadata {
  bool has_branches = false;
  bool has_loops = false;
  bool has_try_catch = false;
  bool has_early_return = false;
  bool has_throw = false;
  bool has_async_throw = false;
  bool can_reject = false;
  int cyclomatic_complexity = 1;
  std::vector<std::string> rejected_builtin_errors;
  std::vector<std::string> thrown_builtin_errors;
};

struct FunctionAttributes {
  bool is_async = false;
  bool is_generator = false;
  bool is_arrow = false;
  bool is_method = false;
  std::string class_name;
  std::vector<std::string> parameters;
  ControlFlowMetadata control_flow;
  std::vector<RejectionPattern> rejection_patterns;
};

struct ClassAttributes {
  std::string super_class;
};

struct CallAttributes {
  std::string object;
  std::string method;
  bool is_method_call = false;
  bool is_awaited = false;
  bool is_inside_try = false;
  int argument_count = 0;
};

struct ConstructorCallAttributes {
  std::string class_name;
  int argument_count = 0;
};

struct LiteralAttributes {
  int entry_count = 0;
};

struct VariableAttributes {
  std::string kind;
};

struct ParameterAttributes {
  int index = 0;
  bool is_rest = false;
  bool has_default = false;
};

struct BlockAttributes {
  std::string parameter_name;
  std::string parent_try_block_id;
};

struct ImportAttributes {
  std::string source;
  std::string imported;
  std::string local;
};

struct ExportAttributes {
  std::string exported;
  std::string local;
  std::string source;
  bool is_default = false;
};

using NodeAttributes =
    std::variant<std::monostate, FunctionAttributes, ClassAttributes,
                 CallAttributes, ConstructorCallAttributes, LiteralAttributes,
                 VariableAttributes, ParameterAttributes, BlockAttributes,
                 ImportAttributes, ExportAttributes>;

struct NodeRecord {
  std::string id;
  NodeType type = NodeType::kModule;
  std::string name;
  std::string file;
  int line = 0;
  int column = 0;
  NodeAttributes attributes;

  FunctionAttributes *AsFunction() {
    return std::get_if<FunctionAttributes>(&attributes);
  }
  const FunctionAttributes *AsFunction() const {
    return std::get_if<FunctionAttributes>(&attributes);
  }
  const CallAttributes *AsCall() const {
    return std::get_if<CallAttributes>(&attributes);
  }
  const ClassAttributes *AsClass() const {
    return std::get_if<ClassAttributes>(&attributes);
  }
  const BlockAttributes *AsBlock() const {
    return std::get_if<BlockAttributes>(&attributes);
  }
  const ImportAttributes *AsImport() const {
    return std::get_if<ImportAttributes>(&attributes);
  }
  const ExportAttributes *AsExport() const {
    return std::get_if<ExportAttributes>(&attributes);
  }
};

using EdgeMetadata = std::map<std::string, std::string>;

struct EdgeRecord {
  EdgeType type = EdgeType::kContains;
  std::string src;
  std::string dst;
  EdgeMetadata metadata;
};

struct NodeFilter {
  std::optional<NodeType> type;
  std::optional<std::string> name;
  std::optional<std::string> file;
};

struct EdgeFilter {
  std::optional<EdgeType> type;
  std::optional<std::string> src;
  std::optional<std::string> dst;
};

struct StorageResult {
  std::size_t written = 0;
  std::size_t duplicates = 0;
};

} // namespace jsgraph
