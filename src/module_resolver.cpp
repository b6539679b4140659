#include <jsgraph/module_resolver.h>

#include <filesystem>
#include <utility>

namespace jsgraph {
namespace {

bool IsRelative(const std::string &specifier) {
  return specifier == "." || specifier == ".." ||
         specifier.rfind("./", 0) == 0 || specifier.rfind("../", 0) == 0;
}

bool EndsWith(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) ==
             0;
}

} // namespace

std::vector<std::string> DefaultModuleExtensions() {
  return {".js", ".jsx", ".mjs", ".cjs", ".ts", ".tsx", ".mts", ".cts"};
}

RelativeModuleResolver::RelativeModuleResolver(
    std::set<std::string> modules, std::vector<std::string> extensions)
    : modules_(std::move(modules)), extensions_(std::move(extensions)) {
  if (extensions_.empty()) {
    extensions_ = DefaultModuleExtensions();
  }
}

std::optional<std::string>
RelativeModuleResolver::Resolve(const std::string &importer,
                                const std::string &specifier) const {
  if (!IsRelative(specifier)) {
    return std::nullopt;
  }
  const auto directory = std::filesystem::path(importer).parent_path();
  auto base = (directory / specifier).lexically_normal().generic_string();
  if (base.rfind("./", 0) == 0) {
    base = base.substr(2);
  }
  if (base.rfind("../", 0) == 0) {
    return std::nullopt;
  }
  if (!base.empty() && base.back() == '/') {
    base.pop_back();
  }

  if (auto found = FindCandidate(base)) {
    return found;
  }
  // ESM TypeScript imports name the emitted `.js` file.
  for (const auto &[emitted, sources] :
       std::vector<std::pair<std::string, std::vector<std::string>>>{
           {".js", {".ts", ".tsx"}}, {".mjs", {".mts"}}, {".cjs", {".cts"}}}) {
    if (!EndsWith(base, emitted)) {
      continue;
    }
    const auto stem = base.substr(0, base.size() - emitted.size());
    for (const auto &source : sources) {
      if (modules_.count(stem + source) > 0) {
        return stem + source;
      }
    }
  }
  return std::nullopt;
}

std::optional<std::string>
RelativeModuleResolver::FindCandidate(const std::string &base) const {
  if (modules_.count(base) > 0) {
    return base;
  }
  for (const auto &extension : extensions_) {
    if (modules_.count(base + extension) > 0) {
      return base + extension;
    }
  }
  const auto index = base.empty() ? std::string("index") : base + "/index";
  for (const auto &extension : extensions_) {
    if (modules_.count(index + extension) > 0) {
      return index + extension;
    }
  }
  return std::nullopt;
}

} // namespace jsgraph
