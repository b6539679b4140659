#include <jsgraph/in_memory_graph_backend.h>

#include <algorithm>
#include <stdexcept>

namespace jsgraph {
namespace {

bool Matches(const NodeRecord &node, const NodeFilter &filter) {
  return (!filter.type || node.type == *filter.type) &&
         (!filter.name || node.name == *filter.name) &&
         (!filter.file || node.file == *filter.file);
}

bool Matches(const EdgeRecord &edge, const EdgeFilter &filter) {
  return (!filter.type || edge.type == *filter.type) &&
         (!filter.src || edge.src == *filter.src) &&
         (!filter.dst || edge.dst == *filter.dst);
}

bool TypeSelected(EdgeType type, const std::vector<EdgeType> &types) {
  return types.empty() ||
         std::find(types.begin(), types.end(), type) != types.end();
}

} // namespace

bool InMemoryGraphBackend::InsertNode(const NodeRecord &node) {
  const auto [position, inserted] = nodes_.emplace(node.id, node);
  if (!inserted) {
    position->second = node;
  }
  return inserted;
}

StorageResult InMemoryGraphBackend::AddNode(const NodeRecord &node) {
  std::lock_guard<std::mutex> lock(mutex_);
  StorageResult result;
  if (InsertNode(node)) {
    ++result.written;
  } else {
    ++result.duplicates;
  }
  return result;
}

StorageResult
InMemoryGraphBackend::AddNodes(const std::vector<NodeRecord> &nodes) {
  std::lock_guard<std::mutex> lock(mutex_);
  StorageResult result;
  for (const auto &node : nodes) {
    if (InsertNode(node)) {
      ++result.written;
    } else {
      ++result.duplicates;
    }
  }
  return result;
}

StorageResult
InMemoryGraphBackend::AddEdges(const std::vector<EdgeRecord> &edges,
                               bool skip_target_validation) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!skip_target_validation) {
    for (const auto &edge : edges) {
      for (const auto *endpoint : {&edge.src, &edge.dst}) {
        if (nodes_.count(*endpoint) == 0) {
          throw std::invalid_argument(ToString(edge.type) + " edge " +
                                      edge.src + " -> " + edge.dst +
                                      " references missing node " + *endpoint);
        }
      }
    }
  }

  StorageResult result;
  for (const auto &edge : edges) {
    if (!edge_keys_.emplace(edge.type, edge.src, edge.dst).second) {
      ++result.duplicates;
      continue;
    }
    const auto position = edges_.size();
    edges_.push_back(edge);
    outgoing_[edge.src].push_back(position);
    incoming_[edge.dst].push_back(position);
    ++result.written;
  }
  return result;
}

std::optional<NodeRecord>
InMemoryGraphBackend::GetNode(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto found = nodes_.find(id);
  if (found == nodes_.end()) {
    return std::nullopt;
  }
  return found->second;
}

std::vector<NodeRecord>
InMemoryGraphBackend::QueryNodes(const NodeFilter &filter) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<NodeRecord> matches;
  for (const auto &entry : nodes_) {
    if (Matches(entry.second, filter)) {
      matches.push_back(entry.second);
    }
  }
  return matches;
}

std::vector<EdgeRecord>
InMemoryGraphBackend::QueryEdges(const EdgeFilter &filter) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<EdgeRecord> matches;
  if (filter.src) {
    const auto found = outgoing_.find(*filter.src);
    if (found != outgoing_.end()) {
      for (const auto position : found->second) {
        if (Matches(edges_[position], filter)) {
          matches.push_back(edges_[position]);
        }
      }
    }
    return matches;
  }
  for (const auto &edge : edges_) {
    if (Matches(edge, filter)) {
      matches.push_back(edge);
    }
  }
  return matches;
}

std::vector<EdgeRecord> InMemoryGraphBackend::CollectEdges(
    const std::unordered_map<std::string, std::vector<std::size_t>> &adjacency,
    const std::string &id, const std::vector<EdgeType> &types) const {
  std::vector<EdgeRecord> matches;
  const auto found = adjacency.find(id);
  if (found == adjacency.end()) {
    return matches;
  }
  for (const auto position : found->second) {
    if (TypeSelected(edges_[position].type, types)) {
      matches.push_back(edges_[position]);
    }
  }
  return matches;
}

std::vector<EdgeRecord>
InMemoryGraphBackend::GetIncomingEdges(const std::string &id,
                                       const std::vector<EdgeType> &types) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CollectEdges(incoming_, id, types);
}

std::vector<EdgeRecord>
InMemoryGraphBackend::GetOutgoingEdges(const std::string &id,
                                       const std::vector<EdgeType> &types) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CollectEdges(outgoing_, id, types);
}

std::map<NodeType, std::size_t> InMemoryGraphBackend::CountNodesByType() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<NodeType, std::size_t> counts;
  for (const auto &entry : nodes_) {
    ++counts[entry.second.type];
  }
  return counts;
}

std::map<EdgeType, std::size_t> InMemoryGraphBackend::CountEdgesByType() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<EdgeType, std::size_t> counts;
  for (const auto &edge : edges_) {
    ++counts[edge.type];
  }
  return counts;
}

StorageResult InMemoryGraphBackend::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  StorageResult result;
  result.written = nodes_.size() + edges_.size();
  nodes_.clear();
  edges_.clear();
  edge_keys_.clear();
  outgoing_.clear();
  incoming_.clear();
  return result;
}

} // namespace jsgraph
