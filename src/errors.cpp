#include <jsgraph/errors.h>

#include <utility>

namespace jsgraph {
namespace {
std::string FormatParseMessage(const std::string &file, int line, int column,
                               const std::string &message) {
  return file + ":" + std::to_string(line) + ":" + std::to_string(column) +
         ": " + message;
}
} // namespace

ValidationError::ValidationError(const std::string &message)
    : std::invalid_argument(message) {}

ParseError::ParseError(std::string file, int line, int column,
                       const std::string &message)
    : std::runtime_error(FormatParseMessage(file, line, column, message)),
      file_(std::move(file)), line_(line), column_(column), detail_(message) {}

ConcurrencyConflictError::ConcurrencyConflictError(const std::string &message)
    : std::runtime_error(message) {}

LockTimeoutError::LockTimeoutError(const std::string &message)
    : std::runtime_error(message) {}

} // namespace jsgraph
