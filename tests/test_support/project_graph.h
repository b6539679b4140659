#ifndef JSGRAPH_TEST_SUPPORT_PROJECT_GRAPH_H
#define JSGRAPH_TEST_SUPPORT_PROJECT_GRAPH_H

#include <jsgraph/ast_analyzer.h>
#include <jsgraph/graph_builder.h>
#include <jsgraph/interfaces.h>

#include <string>
#include <utility>
#include <vector>

namespace jsgraph {
namespace test {

using SourceFiles = std::vector<std::pair<std::string, std::string>>;

// Analyzes in-memory sources and writes them to `graph` the way the pipeline
// does before enrichment. Classes imported from other files stay unlinked
// until ImportedCallResolver runs.
inline void BuildProjectGraph(GraphBackend &graph, const SourceFiles &files) {
  const AstAnalyzer analyzer;
  const GraphBuilder builder;
  for (const auto &file : files) {
    builder.Build(analyzer.AnalyzeSource(file.second, file.first), graph);
  }
}

inline std::vector<EdgeRecord> EdgesOfType(const GraphBackend &graph,
                                           EdgeType type) {
  EdgeFilter filter;
  filter.type = type;
  return graph.QueryEdges(filter);
}

inline std::vector<EdgeRecord> EdgesBetween(const GraphBackend &graph,
                                            EdgeType type,
                                            const std::string &src,
                                            const std::string &dst) {
  EdgeFilter filter;
  filter.type = type;
  filter.src = src;
  filter.dst = dst;
  return graph.QueryEdges(filter);
}

} // namespace test
} // namespace jsgraph

#endif // JSGRAPH_TEST_SUPPORT_PROJECT_GRAPH_H
