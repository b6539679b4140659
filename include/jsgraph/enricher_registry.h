#pragma once

#include <jsgraph/interfaces.h>
#include <jsgraph/logging.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace jsgraph {

struct EnricherOptions {
  std::size_t max_iterations = kDefaultMaxIterations;
  std::shared_ptr<Logger> logger;
};

class EnricherRegistry {
public:
  using EnricherFactory =
      std::function<std::unique_ptr<Enricher>(const EnricherOptions &)>;

  // Enrichers registered with `run_by_default` run, in registration order,
  // when no explicit selection is made.
  void RegisterEnricher(const std::string &name, EnricherFactory factory,
                        bool run_by_default = true);

  std::unique_ptr<Enricher> CreateEnricher(const std::string &name,
                                           const EnricherOptions &options) const;
  std::vector<std::unique_ptr<Enricher>>
  CreateEnrichers(const std::vector<std::string> &names,
                  const EnricherOptions &options) const;

  std::vector<std::string> EnricherNames() const;
  const std::vector<std::string> &DefaultEnricherNames() const;

private:
  std::string JoinNames() const;

  std::unordered_map<std::string, EnricherFactory> factories_;
  std::vector<std::string> default_names_;
};

EnricherRegistry MakeEnricherRegistryWithDefaults();
const EnricherRegistry &GlobalEnricherRegistry();

} // namespace jsgraph
