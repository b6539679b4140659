#pragma once

#include <jsgraph/collections.h>
#include <jsgraph/interfaces.h>
#include <jsgraph/logging.h>

#include <cstddef>
#include <memory>

namespace jsgraph {

struct GraphBuildResult {
  std::size_t nodes = 0;
  std::size_t edges = 0;
  std::size_t builtin_errors = 0;
};

// Turns one file's collections into nodes and edges. Same-file references
// resolve to the real node IDs. Class names bound by an import are left to
// the imported-calls enricher. Other error classes that resolve to no class
// of the file are recorded on the owning function as built-in errors.
class GraphBuilder {
public:
  explicit GraphBuilder(std::shared_ptr<Logger> logger = nullptr);

  GraphBuildResult Build(const FileCollections &collections,
                         GraphBackend &graph) const;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace jsgraph
