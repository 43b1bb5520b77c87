/**
 * @file signal.h
 * @brief Error signal value type
 *
 * A Signal is one observed error occurrence as produced by the upstream
 * error-construction layer. The cache only reads it.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "utils/clock.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace errdedup::signal {

/**
 * @brief Severity derived from the status code
 */
enum class Severity : std::uint8_t {
  kLow,
  kMedium,
  kHigh,
  kCritical,
};

/**
 * @brief Derive severity: >=500 critical, >=400 high, >=300 medium, else low
 */
Severity SeverityFromStatus(int status_code);

/**
 * @brief "low" | "medium" | "high" | "critical"
 */
const char* SeverityToString(Severity severity);

/**
 * @brief Parse a severity name (case-sensitive)
 * @return Severity or kInvalidArgument
 */
utils::Expected<Severity, utils::Error> ParseSeverity(const std::string& name);

/**
 * @brief Immutable error occurrence
 *
 * Context is an optional JSON object (string keys, arbitrary values).
 * A context that is present but not an object is stored as-is; similarity
 * scoring treats it as an opaque value.
 */
class Signal {
 public:
  Signal(std::string code, std::string message, int status_code,
         std::optional<nlohmann::json> context = std::nullopt, bool operational = true,
         utils::Timestamp timestamp = std::chrono::system_clock::now());

  [[nodiscard]] const std::string& code() const { return code_; }
  [[nodiscard]] const std::string& message() const { return message_; }
  [[nodiscard]] int status_code() const { return status_code_; }
  [[nodiscard]] const std::optional<nlohmann::json>& context() const { return context_; }
  [[nodiscard]] bool has_context() const { return context_.has_value(); }
  [[nodiscard]] bool operational() const { return operational_; }
  [[nodiscard]] utils::Timestamp timestamp() const { return timestamp_; }

  [[nodiscard]] Severity severity() const { return SeverityFromStatus(status_code_); }

 private:
  std::string code_;
  std::string message_;
  int status_code_;
  std::optional<nlohmann::json> context_;
  bool operational_;
  utils::Timestamp timestamp_;
};

}  // namespace errdedup::signal
