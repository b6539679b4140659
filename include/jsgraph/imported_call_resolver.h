#pragma once

#include <jsgraph/interfaces.h>
#include <jsgraph/logging.h>

#include <memory>
#include <string>

namespace jsgraph {

// Links imports to the exports they name and calls of imported functions to
// the function declared in the exporting module. Follows `export ... from`
// re-exports across files.
class ImportedCallResolver : public Enricher {
public:
  static constexpr const char *kName = "imported-calls";

  explicit ImportedCallResolver(std::shared_ptr<Logger> logger = nullptr);

  std::string Name() const override { return kName; }
  EnrichmentResult Enrich(GraphBackend &graph) override;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace jsgraph
