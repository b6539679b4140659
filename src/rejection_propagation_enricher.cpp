#include <jsgraph/rejection_propagation_enricher.h>

#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace jsgraph {
namespace {

struct CallFacts {
  bool is_awaited = false;
  bool is_inside_try = false;
};

struct PropagationIndex {
  // Ordered so rounds visit functions deterministically.
  std::set<std::string> async_functions;
  std::unordered_map<std::string, std::set<std::string>> rejects;
  std::unordered_map<std::string, std::set<std::string>> call_targets;
  std::unordered_map<std::string, std::vector<std::string>> function_calls;
  std::unordered_map<std::string, CallFacts> calls;
};

PropagationIndex BuildIndex(const GraphBackend &graph) {
  PropagationIndex index;
  for (const auto &function : graph.QueryNodes({NodeType::kFunction, {}, {}})) {
    const auto *attributes = function.AsFunction();
    if (attributes != nullptr && attributes->is_async) {
      index.async_functions.insert(function.id);
    }
  }
  for (const auto &call : graph.QueryNodes({NodeType::kCall, {}, {}})) {
    if (const auto *attributes = call.AsCall()) {
      index.calls[call.id] = {attributes->is_awaited,
                              attributes->is_inside_try};
    }
  }
  for (const auto &edge : graph.QueryEdges({EdgeType::kRejects, {}, {}})) {
    index.rejects[edge.src].insert(edge.dst);
  }
  for (const auto &edge : graph.QueryEdges({EdgeType::kCalls, {}, {}})) {
    index.call_targets[edge.src].insert(edge.dst);
  }
  for (const auto &edge : graph.QueryEdges({EdgeType::kContains, {}, {}})) {
    if (index.async_functions.count(edge.src) > 0 &&
        index.calls.count(edge.dst) > 0) {
      index.function_calls[edge.src].push_back(edge.dst);
    }
  }
  return index;
}

void MarkCanReject(GraphBackend &graph, const std::string &function_id) {
  auto node = graph.GetNode(function_id);
  if (!node) {
    return;
  }
  auto *attributes = node->AsFunction();
  if (attributes == nullptr || attributes->control_flow.can_reject) {
    return;
  }
  attributes->control_flow.can_reject = true;
  graph.AddNode(*node);
}

} // namespace

RejectionPropagationEnricher::RejectionPropagationEnricher(
    std::size_t max_iterations, std::shared_ptr<Logger> logger)
    : max_iterations_(max_iterations),
      logger_(EnsureLogger(std::move(logger))) {}

EnrichmentResult RejectionPropagationEnricher::Enrich(GraphBackend &graph) {
  EnrichmentResult result;
  result.enricher = Name();
  result.converged = false;

  auto index = BuildIndex(graph);
  while (result.iterations < max_iterations_) {
    ++result.iterations;
    // A round only sees rejections known when it started.
    const auto previous = index.rejects;
    std::vector<EdgeRecord> added;
    for (const auto &function : index.async_functions) {
      const auto calls = index.function_calls.find(function);
      if (calls == index.function_calls.end()) {
        continue;
      }
      for (const auto &call : calls->second) {
        const auto &facts = index.calls[call];
        if (!facts.is_awaited || facts.is_inside_try) {
          continue;
        }
        const auto targets = index.call_targets.find(call);
        if (targets == index.call_targets.end()) {
          continue;
        }
        for (const auto &target : targets->second) {
          const auto rejected = previous.find(target);
          if (rejected == previous.end()) {
            continue;
          }
          for (const auto &error_class : rejected->second) {
            if (!index.rejects[function].insert(error_class).second) {
              continue;
            }
            added.push_back({EdgeType::kRejects,
                             function,
                             error_class,
                             {{"rejectionType", "propagated"},
                              {"propagatedFrom", target}}});
          }
        }
      }
    }

    if (added.empty()) {
      result.converged = true;
      break;
    }
    // Targets may be classes that only exist in files not analyzed yet.
    result.edges_created += graph.AddEdges(added, true).written;
    for (const auto &edge : added) {
      MarkCanReject(graph, edge.src);
    }
  }

  if (!result.converged) {
    result.warnings.push_back(
        "rejection propagation stopped after " +
        std::to_string(result.iterations) +
        " iterations without converging; propagated edges may be incomplete");
    logger_->Log(LogLevel::kWarn, "enrichment.non_convergence",
                 {{"enricher", result.enricher},
                  {"iterations", std::to_string(result.iterations)},
                  {"edges_created", std::to_string(result.edges_created)}});
  }
  logger_->Log(LogLevel::kInfo, "enrichment.complete",
               {{"enricher", result.enricher},
                {"edges_created", std::to_string(result.edges_created)},
                {"iterations", std::to_string(result.iterations)},
                {"converged", result.converged ? "true" : "false"}});
  return result;
}

} // namespace jsgraph
