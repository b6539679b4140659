#pragma once

#include <jsgraph/interfaces.h>
#include <jsgraph/logging.h>

#include <cstddef>
#include <memory>
#include <string>

namespace jsgraph {

// Propagates REJECTS edges backwards along awaited calls that are not
// protected by a try block: when async function F awaits a call to T outside
// any try and T rejects with E, F rejects with E too. Rounds repeat until
// one adds nothing or `max_iterations` rounds have run.
class RejectionPropagationEnricher : public Enricher {
public:
  static constexpr const char *kName = "rejection-propagation";

  explicit RejectionPropagationEnricher(
      std::size_t max_iterations = kDefaultMaxIterations,
      std::shared_ptr<Logger> logger = nullptr);

  std::string Name() const override { return kName; }
  EnrichmentResult Enrich(GraphBackend &graph) override;

private:
  std::size_t max_iterations_;
  std::shared_ptr<Logger> logger_;
};

} // namespace jsgraph
