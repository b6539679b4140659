#include <jsgraph/enricher_registry.h>

#include <jsgraph/imported_call_resolver.h>
#include <jsgraph/rejection_propagation_enricher.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace jsgraph {

void EnricherRegistry::RegisterEnricher(const std::string &name,
                                        EnricherFactory factory,
                                        bool run_by_default) {
  if (name.empty()) {
    throw std::invalid_argument("Enricher name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (factories_.count(name) != 0) {
    throw std::invalid_argument("Enricher with name '" + name +
                                "' already registered");
  }
  factories_.emplace(name, std::move(factory));
  if (run_by_default) {
    default_names_.push_back(name);
  }
}

std::unique_ptr<Enricher>
EnricherRegistry::CreateEnricher(const std::string &name,
                                 const EnricherOptions &options) const {
  const auto found = factories_.find(name);
  if (found == factories_.end()) {
    throw std::invalid_argument("Unknown enricher '" + name +
                                "'. Registered: " + JoinNames());
  }
  auto instance = found->second(options);
  if (!instance) {
    throw std::runtime_error("Factory for enricher '" + name +
                             "' returned null");
  }
  return instance;
}

std::vector<std::unique_ptr<Enricher>>
EnricherRegistry::CreateEnrichers(const std::vector<std::string> &names,
                                  const EnricherOptions &options) const {
  const auto &selected = names.empty() ? default_names_ : names;
  std::vector<std::unique_ptr<Enricher>> enrichers;
  enrichers.reserve(selected.size());
  for (const auto &name : selected) {
    enrichers.push_back(CreateEnricher(name, options));
  }
  return enrichers;
}

std::vector<std::string> EnricherRegistry::EnricherNames() const {
  std::vector<std::string> names;
  names.reserve(factories_.size());
  for (const auto &entry : factories_) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

const std::vector<std::string> &EnricherRegistry::DefaultEnricherNames() const {
  return default_names_;
}

std::string EnricherRegistry::JoinNames() const {
  const auto names = EnricherNames();
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

EnricherRegistry MakeEnricherRegistryWithDefaults() {
  EnricherRegistry registry;
  registry.RegisterEnricher(
      ImportedCallResolver::kName, [](const EnricherOptions &options) {
        return std::make_unique<ImportedCallResolver>(options.logger);
      });
  registry.RegisterEnricher(
      RejectionPropagationEnricher::kName, [](const EnricherOptions &options) {
        return std::make_unique<RejectionPropagationEnricher>(
            options.max_iterations, options.logger);
      });
  return registry;
}

const EnricherRegistry &GlobalEnricherRegistry() {
  static const EnricherRegistry registry = MakeEnricherRegistryWithDefaults();
  return registry;
}

} // namespace jsgraph
