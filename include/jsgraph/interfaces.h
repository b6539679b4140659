#pragma once

#include <jsgraph/collections.h>
#include <jsgraph/graph.h>
#include <jsgraph/models.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace jsgraph {

class SourceAcquirer {
public:
  virtual ~SourceAcquirer() = default;
  virtual SourceAcquisitionResult Acquire(const AnalysisConfig &config) = 0;
};

class FileAnalyzer {
public:
  virtual ~FileAnalyzer() = default;
  // Throws ParseError when the file cannot be parsed.
  virtual FileCollections Analyze(const SourceFile &file) const = 0;
};

// Storage the graph is written to and queried from. Edges may point at node
// IDs that do not exist yet unless target validation is requested.
class GraphBackend {
public:
  virtual ~GraphBackend() = default;

  virtual StorageResult AddNode(const NodeRecord &node) = 0;
  virtual StorageResult AddNodes(const std::vector<NodeRecord> &nodes) = 0;
  virtual StorageResult AddEdges(const std::vector<EdgeRecord> &edges,
                                 bool skip_target_validation = true) = 0;

  virtual std::optional<NodeRecord> GetNode(const std::string &id) const = 0;
  virtual std::vector<NodeRecord> QueryNodes(const NodeFilter &filter) const = 0;
  virtual std::vector<EdgeRecord> QueryEdges(const EdgeFilter &filter) const = 0;
  virtual std::vector<EdgeRecord>
  GetIncomingEdges(const std::string &id,
                   const std::vector<EdgeType> &types = {}) const = 0;
  virtual std::vector<EdgeRecord>
  GetOutgoingEdges(const std::string &id,
                   const std::vector<EdgeType> &types = {}) const = 0;

  virtual std::map<NodeType, std::size_t> CountNodesByType() const = 0;
  virtual std::map<EdgeType, std::size_t> CountEdgesByType() const = 0;

  virtual StorageResult Clear() = 0;
};

// A whole-graph pass run after every file of a batch has been built.
class Enricher {
public:
  virtual ~Enricher() = default;
  virtual std::string Name() const = 0;
  virtual EnrichmentResult Enrich(GraphBackend &graph) = 0;
};

class Reporter {
public:
  virtual ~Reporter() = default;
  virtual Report Render(const AnalysisResult &result,
                        const GraphBackend &graph,
                        const AnalysisConfig &config) = 0;
};

class AnalyzerPipeline {
public:
  virtual ~AnalyzerPipeline() = default;
  virtual AnalysisResult Run(const AnalysisConfig &config) = 0;
};

} // namespace jsgraph
