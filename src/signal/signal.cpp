/**
 * @file signal.cpp
 * @brief Signal and severity implementation
 */

#include "signal/signal.h"

namespace errdedup::signal {

namespace {

constexpr int kCriticalStatus = 500;
constexpr int kHighStatus = 400;
constexpr int kMediumStatus = 300;

}  // namespace

Severity SeverityFromStatus(int status_code) {
  if (status_code >= kCriticalStatus) {
    return Severity::kCritical;
  }
  if (status_code >= kHighStatus) {
    return Severity::kHigh;
  }
  if (status_code >= kMediumStatus) {
    return Severity::kMedium;
  }
  return Severity::kLow;
}

const char* SeverityToString(Severity severity) {
  switch (severity) {
    case Severity::kLow:
      return "low";
    case Severity::kMedium:
      return "medium";
    case Severity::kHigh:
      return "high";
    case Severity::kCritical:
      return "critical";
  }
  return "low";
}

utils::Expected<Severity, utils::Error> ParseSeverity(const std::string& name) {
  if (name == "low") {
    return Severity::kLow;
  }
  if (name == "medium") {
    return Severity::kMedium;
  }
  if (name == "high") {
    return Severity::kHigh;
  }
  if (name == "critical") {
    return Severity::kCritical;
  }
  return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument,
                                                "severity must be one of: low, medium, high, critical (got: " +
                                                    name + ")"));
}

Signal::Signal(std::string code, std::string message, int status_code, std::optional<nlohmann::json> context,
               bool operational, utils::Timestamp timestamp)
    : code_(std::move(code)),
      message_(std::move(message)),
      status_code_(status_code),
      context_(std::move(context)),
      operational_(operational),
      timestamp_(timestamp) {}

}  // namespace errdedup::signal
