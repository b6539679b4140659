#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace jsgraph {

constexpr std::size_t kDefaultMaxTraceHops = 5;

enum class BindingKind {
  // `x = new Class(...)`
  kConstruction,
  // `x = y`
  kAlias,
  kParameter,
  // Any value the trace cannot follow, e.g. a call result.
  kOpaque,
};

struct Binding {
  BindingKind kind = BindingKind::kOpaque;
  // Class name for kConstruction, aliased identifier for kAlias.
  std::string target;
  // Graph node the name is bound to, when one exists.
  std::string node_id;
};

// Latest known value of each local name of one function body. Later
// declarations and assignments overwrite earlier ones.
class BindingFrame {
public:
  void Bind(const std::string &name, Binding binding);
  void Unbind(const std::string &name);
  const Binding *Find(const std::string &name) const;

private:
  std::unordered_map<std::string, Binding> bindings_;
};

enum class TraceOutcome { kResolved, kParameter, kUnresolved };

struct TraceResult {
  TraceOutcome outcome = TraceOutcome::kUnresolved;
  std::string class_name;
  // Identifiers visited in order, ending with `new Class` when resolved.
  std::vector<std::string> path;
  bool cycle = false;
};

// Follows alias chains from `name` through `frames` (innermost first) until
// a construction, a parameter or a dead end. Every name is visited at most
// once and at most `max_hops` aliases are followed.
TraceResult TraceIdentifier(const std::string &name,
                            const std::vector<const BindingFrame *> &frames,
                            std::size_t max_hops = kDefaultMaxTraceHops);

} // namespace jsgraph
