/**
 * @file error.h
 * @brief Error codes and the Result<T> return type used across babylonify.
 *
 * Every fallible operation in the filtering engine returns a Result<T>.
 * Failures are values: a per-file failure in directory mode is stored in the
 * run report instead of unwinding through sibling files.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace babylonify {

enum class ErrorCode {
  NONE = 0,

  // Run-wide errors
  UNKNOWN_LANGUAGE, // Language token did not resolve to a detector language
  INVALID_ARGUMENT, // Bad configuration (paths, thread count, batch size)

  // Per-file errors
  SCHEMA_ERROR,    // Text column missing or not a string column
  IO_ERROR,        // Open/read/write/finalize failure
  DETECTION_ERROR, // Detector rejected a value (e.g. malformed UTF-8)

  INTERNAL_ERROR // Unexpected exception inside a worker
};

const char* error_code_to_string(ErrorCode code);

/// An error code with a human-readable message.
class Error {
public:
  Error() = default;
  Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  bool ok() const { return code_ == ErrorCode::NONE; }

  /// "SCHEMA_ERROR: Column 'text' not found"
  std::string to_string() const;

private:
  ErrorCode code_ = ErrorCode::NONE;
  std::string message_;
};

/// Exception wrapper for callers that prefer throwing over Result<T>.
class FilterException : public std::runtime_error {
public:
  explicit FilterException(Error error)
      : std::runtime_error(error.to_string()), error_(std::move(error)) {}

  const Error& error() const { return error_; }

private:
  Error error_;
};

/**
 * @brief Value-or-error return type.
 *
 * @code
 * auto lang = resolve_language("uk");
 * if (!lang.ok)
 *   std::cerr << lang.error.to_string() << "\n";
 * @endcode
 */
template <typename T> struct Result {
  T value{};
  Error error;
  bool ok = false;

  static Result success(T v) {
    Result r;
    r.value = std::move(v);
    r.ok = true;
    return r;
  }

  static Result failure(Error e) {
    Result r;
    r.error = std::move(e);
    return r;
  }

  static Result failure(ErrorCode code, std::string message) {
    return failure(Error(code, std::move(message)));
  }

  /// Returns the value or throws FilterException.
  T& value_or_throw() {
    if (!ok)
      throw FilterException(error);
    return value;
  }
};

} // namespace babylonify
