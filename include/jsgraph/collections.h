#pragma once

#include <jsgraph/graph.h>

#include <cstddef>
#include <string>
#include <vector>

namespace jsgraph {

struct ContainmentInfo {
  std::string parent_id;
  std::string child_id;
};

// A call whose target may be declared in the same file: a plain `name(...)`
// call or a `this.name(...)` call inside a class.
struct CallSiteInfo {
  std::string call_id;
  std::string callee;
  bool is_this_call = false;
  // Lexical scope the call appears in.
  std::vector<std::string> scope_path;
  // Scope of the enclosing class body, for `this.name(...)`.
  std::vector<std::string> class_scope_path;
};

struct ClassDeclarationInfo {
  std::string class_id;
  std::string name;
  std::string super_class;
  std::vector<std::string> scope_path;
};

enum class CatchSourceType {
  kAwaitedCall,
  kSyncCall,
  kThrowStatement,
  kConstructorCall,
};

std::string ToString(CatchSourceType type);

struct CatchesFromInfo {
  std::string catch_block_id;
  std::string parameter_name;
  std::string source_id;
  CatchSourceType source_type = CatchSourceType::kSyncCall;
  int source_line = 0;
};

// A call of the resolve or reject parameter of a promise executor.
struct PromiseSettlementInfo {
  std::string call_id;
  std::string promise_id;
  bool is_reject = false;
};

struct AssignmentInfo {
  std::string variable_id;
  std::string source_id;
};

struct InstantiationInfo {
  std::string variable_id;
  std::string class_name;
  std::vector<std::string> scope_path;
};

// Everything one analyzer pass learned about one file. Nodes are complete
// records; the remaining vectors describe relations the graph builder turns
// into edges.
struct FileCollections {
  std::string file;
  NodeRecord module;
  std::vector<NodeRecord> functions;
  std::vector<NodeRecord> classes;
  std::vector<NodeRecord> calls;
  std::vector<NodeRecord> constructor_calls;
  std::vector<NodeRecord> literals;
  std::vector<NodeRecord> variables;
  std::vector<NodeRecord> parameters;
  std::vector<NodeRecord> blocks;
  std::vector<NodeRecord> imports;
  std::vector<NodeRecord> exports;

  std::vector<ContainmentInfo> containment;
  std::vector<CallSiteInfo> call_sites;
  std::vector<ClassDeclarationInfo> class_declarations;
  std::vector<RejectionPattern> rejection_patterns;
  std::vector<CatchesFromInfo> catches_from;
  std::vector<PromiseSettlementInfo> promise_settlements;
  std::vector<AssignmentInfo> assignments;
  std::vector<InstantiationInfo> instantiations;

  std::size_t NodeCount() const {
    return 1 + functions.size() + classes.size() + calls.size() +
           constructor_calls.size() + literals.size() + variables.size() +
           parameters.size() + blocks.size() + imports.size() +
           exports.size();
  }
};

} // namespace jsgraph
