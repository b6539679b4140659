#include <jsgraph/micro_trace.h>

#include <unordered_set>
#include <utility>

namespace jsgraph {
namespace {

const Binding *Lookup(const std::string &name,
                      const std::vector<const BindingFrame *> &frames) {
  for (const auto *frame : frames) {
    if (frame == nullptr) {
      continue;
    }
    if (const auto *binding = frame->Find(name)) {
      return binding;
    }
  }
  return nullptr;
}

} // namespace

void BindingFrame::Bind(const std::string &name, Binding binding) {
  bindings_[name] = std::move(binding);
}

void BindingFrame::Unbind(const std::string &name) { bindings_.erase(name); }

const Binding *BindingFrame::Find(const std::string &name) const {
  const auto it = bindings_.find(name);
  return it == bindings_.end() ? nullptr : &it->second;
}

TraceResult TraceIdentifier(const std::string &name,
                            const std::vector<const BindingFrame *> &frames,
                            std::size_t max_hops) {
  TraceResult result;
  std::unordered_set<std::string> visited;
  std::string current = name;
  std::size_t hops = 0;

  while (true) {
    if (!visited.insert(current).second) {
      result.cycle = true;
      return result;
    }
    result.path.push_back(current);

    const auto *binding = Lookup(current, frames);
    if (binding == nullptr) {
      return result;
    }
    switch (binding->kind) {
    case BindingKind::kConstruction:
      result.outcome = TraceOutcome::kResolved;
      result.class_name = binding->target;
      result.path.push_back("new " + binding->target);
      return result;
    case BindingKind::kParameter:
      result.outcome = TraceOutcome::kParameter;
      return result;
    case BindingKind::kOpaque:
      return result;
    case BindingKind::kAlias:
      break;
    }

    if (hops == max_hops) {
      return result;
    }
    ++hops;
    current = binding->target;
  }
}

} // namespace jsgraph
