#pragma once

#include <jsgraph/interfaces.h>

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace jsgraph {

// Process-local graph store. Nodes are keyed by ID (a repeated ID replaces
// the stored node), edges are unique per (type, src, dst). Every call is
// serialized, so analysis workers may write concurrently.
class InMemoryGraphBackend : public GraphBackend {
public:
  StorageResult AddNode(const NodeRecord &node) override;
  StorageResult AddNodes(const std::vector<NodeRecord> &nodes) override;
  StorageResult AddEdges(const std::vector<EdgeRecord> &edges,
                         bool skip_target_validation = true) override;

  std::optional<NodeRecord> GetNode(const std::string &id) const override;
  std::vector<NodeRecord> QueryNodes(const NodeFilter &filter) const override;
  std::vector<EdgeRecord> QueryEdges(const EdgeFilter &filter) const override;
  std::vector<EdgeRecord>
  GetIncomingEdges(const std::string &id,
                   const std::vector<EdgeType> &types = {}) const override;
  std::vector<EdgeRecord>
  GetOutgoingEdges(const std::string &id,
                   const std::vector<EdgeType> &types = {}) const override;

  std::map<NodeType, std::size_t> CountNodesByType() const override;
  std::map<EdgeType, std::size_t> CountEdgesByType() const override;

  StorageResult Clear() override;

private:
  using EdgeKey = std::tuple<EdgeType, std::string, std::string>;

  bool InsertNode(const NodeRecord &node);
  std::vector<EdgeRecord>
  CollectEdges(const std::unordered_map<std::string, std::vector<std::size_t>>
                   &adjacency,
               const std::string &id, const std::vector<EdgeType> &types) const;

  mutable std::mutex mutex_;
  std::map<std::string, NodeRecord> nodes_;
  std::vector<EdgeRecord> edges_;
  std::set<EdgeKey> edge_keys_;
  std::unordered_map<std::string, std::vector<std::size_t>> outgoing_;
  std::unordered_map<std::string, std::vector<std::size_t>> incoming_;
};

} // namespace jsgraph
