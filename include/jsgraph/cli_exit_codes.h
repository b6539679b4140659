#pragma once

#include <jsgraph/models.h>

namespace jsgraph {

constexpr int kExitSuccess = 0;
constexpr int kExitError = 1;
constexpr int kExitParseFailures = 2;

// 0 when every file was analyzed, 2 when at least one failed to parse.
int AnalysisExitCode(const AnalysisResult &result);

} // namespace jsgraph
