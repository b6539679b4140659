#pragma once

#include <jsgraph/graph.h>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace jsgraph {

constexpr std::size_t kDefaultMaxIterations = 10;

struct AnalysisConfig {
  std::string root_path;
  std::vector<std::string> formats;
  std::vector<std::string> extensions;
  std::vector<std::string> ignored_paths;
  std::vector<std::string> enrichers;
  std::size_t max_iterations = kDefaultMaxIterations;
  std::size_t max_trace_hops = 5;
  // 0 selects the hardware concurrency.
  std::size_t jobs = 0;
};

struct SourceFile {
  std::string path;
  // Project-relative generic path; node IDs are built from it.
  std::string relative_path;
};

struct SourceAcquisitionResult {
  std::string project_root;
  std::vector<SourceFile> files;
};

struct FileFailure {
  std::string file;
  int line = 0;
  int column = 0;
  std::string message;
};

struct EnrichmentResult {
  std::string enricher;
  std::size_t edges_created = 0;
  bool converged = true;
  std::size_t iterations = 0;
  std::vector<std::string> warnings;
};

struct GraphStatistics {
  std::map<NodeType, std::size_t> nodes;
  std::map<EdgeType, std::size_t> edges;
};

struct Report {
  std::string markdown;
  std::string json;
  std::string graph_json;
};

struct AnalysisResult {
  std::string project_root;
  std::size_t files_analyzed = 0;
  std::vector<FileFailure> failures;
  std::vector<EnrichmentResult> enrichments;
  GraphStatistics statistics;
  std::vector<std::string> warnings;
  bool cancelled = false;
  Report report;
};

} // namespace jsgraph
