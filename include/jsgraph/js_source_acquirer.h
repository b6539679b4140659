#pragma once

#include <jsgraph/interfaces.h>
#include <jsgraph/logging.h>

#include <memory>

namespace jsgraph {

// Collects JavaScript and TypeScript modules below the analysis root.
// `node_modules` and `.git` are never entered.
class JsSourceAcquirer : public SourceAcquirer {
public:
  explicit JsSourceAcquirer(std::shared_ptr<Logger> logger = nullptr);
  SourceAcquisitionResult Acquire(const AnalysisConfig &config) override;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace jsgraph
