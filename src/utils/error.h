/**
 * @file error.h
 * @brief Error type and error codes for errdedup
 *
 * Errors are returned by value (see utils/expected.h) instead of being thrown.
 * Codes are grouped by subsystem in blocks of 1000.
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace errdedup::utils {

/**
 * @brief Error codes
 */
enum class ErrorCode : std::uint16_t {
  // General (0-999)
  kSuccess = 0,
  kInvalidArgument = 2,
  kOutOfRange = 4,

  // Configuration (1000-1999)
  kConfigFileNotFound = 1000,
  kConfigYamlError = 1001,
  kConfigParseError = 1002,
  kConfigValidationError = 1003,
  kConfigInvalidValue = 1004,

  // Signal decoding (2000-2999)
  kSignalParseError = 2000,
  kSignalMissingField = 2001,
  kSignalInvalidField = 2002,
};

/**
 * @brief Get symbolic name of an error code
 */
inline const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "InvalidArgument";
    case ErrorCode::kOutOfRange:
      return "OutOfRange";
    case ErrorCode::kConfigFileNotFound:
      return "ConfigFileNotFound";
    case ErrorCode::kConfigYamlError:
      return "ConfigYamlError";
    case ErrorCode::kConfigParseError:
      return "ConfigParseError";
    case ErrorCode::kConfigValidationError:
      return "ConfigValidationError";
    case ErrorCode::kConfigInvalidValue:
      return "ConfigInvalidValue";
    case ErrorCode::kSignalParseError:
      return "SignalParseError";
    case ErrorCode::kSignalMissingField:
      return "SignalMissingField";
    case ErrorCode::kSignalInvalidField:
      return "SignalInvalidField";
  }
  return "Unknown";
}

/**
 * @brief Error value: code + human-readable message + optional context
 */
class Error {
 public:
  Error() = default;

  Error(ErrorCode code, std::string message, std::string context = "")
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string& message() const { return message_; }
  [[nodiscard]] const std::string& context() const { return context_; }

  /**
   * @brief Format as "[Code] message (context)"
   */
  [[nodiscard]] std::string to_string() const {
    std::string result = "[";
    result += ErrorCodeToString(code_);
    result += "] ";
    result += message_;
    if (!context_.empty()) {
      result += " (" + context_ + ")";
    }
    return result;
  }

 private:
  ErrorCode code_ = ErrorCode::kSuccess;
  std::string message_;
  std::string context_;
};

/**
 * @brief Create an error
 */
inline Error MakeError(ErrorCode code, std::string message = "", std::string context = "") {
  return Error(code, std::move(message), std::move(context));
}

}  // namespace errdedup::utils
