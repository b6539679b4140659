#include <jsgraph/js_source_acquirer.h>

#include <jsgraph/module_resolver.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

namespace jsgraph {

namespace {
const std::set<std::string> &SkippedDirectoryNames() {
  static const std::set<std::string> kNames = {"node_modules", ".git"};
  return kNames;
}

bool IsWithin(const std::filesystem::path &candidate,
              const std::filesystem::path &potential_parent) {
  if (potential_parent.empty()) {
    return false;
  }
  return std::distance(potential_parent.begin(), potential_parent.end()) <=
             std::distance(candidate.begin(), candidate.end()) &&
         std::equal(potential_parent.begin(), potential_parent.end(),
                    candidate.begin());
}

bool IsIgnoredPath(const std::filesystem::path &path,
                   const std::vector<std::filesystem::path> &ignored_paths) {
  return std::any_of(
      ignored_paths.begin(), ignored_paths.end(),
      [&](const auto &ignored) { return IsWithin(path, ignored); });
}

std::filesystem::path ResolveRootPath(const AnalysisConfig &config) {
  if (config.root_path.empty()) {
    throw std::invalid_argument("AnalysisConfig.root_path must not be empty.");
  }

  const auto normalized_root =
      std::filesystem::weakly_canonical(config.root_path);

  if (!std::filesystem::exists(normalized_root) ||
      !std::filesystem::is_directory(normalized_root)) {
    throw std::runtime_error("Analysis root path is not a directory: " +
                             normalized_root.string());
  }

  return normalized_root;
}

std::vector<std::filesystem::path>
ResolveIgnoredPaths(const std::filesystem::path &root,
                    const std::vector<std::string> &ignored) {
  std::vector<std::filesystem::path> paths;
  paths.reserve(ignored.size());
  for (const auto &entry : ignored) {
    const std::filesystem::path path(entry);
    paths.push_back(std::filesystem::weakly_canonical(
        path.is_absolute() ? path : root / path));
  }
  return paths;
}

std::vector<SourceFile>
CollectSourceFiles(const std::filesystem::path &root,
                   const std::set<std::string> &extensions,
                   const std::vector<std::filesystem::path> &ignored_paths) {
  std::vector<SourceFile> files;

  for (std::filesystem::recursive_directory_iterator it(root), end; it != end;
       ++it) {
    const auto &entry = *it;
    if (entry.is_directory() &&
        SkippedDirectoryNames().count(entry.path().filename().string()) > 0) {
      it.disable_recursion_pending();
      continue;
    }
    const auto canonical_path = std::filesystem::weakly_canonical(entry.path());
    if (IsIgnoredPath(canonical_path, ignored_paths)) {
      if (entry.is_directory()) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!entry.is_regular_file() ||
        extensions.count(entry.path().extension().string()) == 0) {
      continue;
    }
    files.push_back(
        {canonical_path.string(),
         canonical_path.lexically_relative(root).generic_string()});
  }

  std::sort(files.begin(), files.end(),
            [](const SourceFile &left, const SourceFile &right) {
              return left.relative_path < right.relative_path;
            });
  files.erase(std::unique(files.begin(), files.end(),
                          [](const SourceFile &left, const SourceFile &right) {
                            return left.relative_path == right.relative_path;
                          }),
              files.end());
  return files;
}
} // namespace

JsSourceAcquirer::JsSourceAcquirer(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

SourceAcquisitionResult JsSourceAcquirer::Acquire(const AnalysisConfig &config) {
  const auto root = ResolveRootPath(config);
  const auto configured =
      config.extensions.empty() ? DefaultModuleExtensions() : config.extensions;
  const std::set<std::string> extensions(configured.begin(), configured.end());

  auto files = CollectSourceFiles(
      root, extensions, ResolveIgnoredPaths(root, config.ignored_paths));
  if (files.empty()) {
    throw std::runtime_error("No JavaScript or TypeScript sources found in " +
                             root.string());
  }

  logger_->Log(
      LogLevel::kInfo, "source.collected",
      {{"count", std::to_string(files.size())}, {"root", root.string()}});

  SourceAcquisitionResult result;
  result.files = std::move(files);
  result.project_root = root.string();
  return result;
}

} // namespace jsgraph
