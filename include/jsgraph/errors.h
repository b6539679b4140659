#pragma once

#include <stdexcept>
#include <string>

namespace jsgraph {

// Raised by NodeFactory when a required field is absent or malformed.
class ValidationError : public std::invalid_argument {
public:
  explicit ValidationError(const std::string &message);
};

// A single source file could not be parsed.
class ParseError : public std::runtime_error {
public:
  ParseError(std::string file, int line, int column,
             const std::string &message);

  const std::string &file() const { return file_; }
  int line() const { return line_; }
  int column() const { return column_; }
  const std::string &detail() const { return detail_; }

private:
  std::string file_;
  int line_;
  int column_;
  std::string detail_;
};

// A forced analysis was requested while another one is in flight.
class ConcurrencyConflictError : public std::runtime_error {
public:
  explicit ConcurrencyConflictError(const std::string &message);
};

// Waiting for the in-flight analysis exceeded the configured timeout.
class LockTimeoutError : public std::runtime_error {
public:
  explicit LockTimeoutError(const std::string &message);
};

} // namespace jsgraph
