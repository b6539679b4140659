#include <jsgraph/cli_exit_codes.h>

namespace jsgraph {

int AnalysisExitCode(const AnalysisResult &result) {
  if (!result.failures.empty()) {
    return kExitParseFailures;
  }
  return kExitSuccess;
}

} // namespace jsgraph
