#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace jsgraph {

class ModuleResolver {
public:
  virtual ~ModuleResolver() = default;
  virtual std::optional<std::string>
  Resolve(const std::string &importer, const std::string &specifier) const = 0;
};

// Resolves relative specifiers (`./x`, `../y/z`) against a fixed set of
// project-relative module paths, probing extensions and `index` files the
// way Node and TypeScript do. Bare package specifiers never resolve.
class RelativeModuleResolver : public ModuleResolver {
public:
  explicit RelativeModuleResolver(std::set<std::string> modules,
                                  std::vector<std::string> extensions = {});

  std::optional<std::string>
  Resolve(const std::string &importer,
          const std::string &specifier) const override;

private:
  std::optional<std::string> FindCandidate(const std::string &base) const;

  std::set<std::string> modules_;
  std::vector<std::string> extensions_;
};

std::vector<std::string> DefaultModuleExtensions();

} // namespace jsgraph
