#include "babylonify/error.h"

namespace babylonify {

const char* error_code_to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::NONE:
    return "NONE";
  case ErrorCode::UNKNOWN_LANGUAGE:
    return "UNKNOWN_LANGUAGE";
  case ErrorCode::INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";
  case ErrorCode::SCHEMA_ERROR:
    return "SCHEMA_ERROR";
  case ErrorCode::IO_ERROR:
    return "IO_ERROR";
  case ErrorCode::DETECTION_ERROR:
    return "DETECTION_ERROR";
  case ErrorCode::INTERNAL_ERROR:
    return "INTERNAL_ERROR";
  default:
    return "UNKNOWN";
  }
}

std::string Error::to_string() const {
  if (message_.empty())
    return error_code_to_string(code_);
  return std::string(error_code_to_string(code_)) + ": " + message_;
}

} // namespace babylonify
