/**
 * @file signal_json.cpp
 * @brief Signal JSON codec implementation
 */

#include "signal/signal_json.h"

#include <chrono>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

namespace errdedup::signal {

namespace {

utils::Error FieldError(utils::ErrorCode code, const std::string& field, const std::string& detail) {
  return utils::MakeError(code, "signal field '" + field + "' " + detail, field);
}

/**
 * @brief True when a container sits deeper than limit (root container = level 1)
 *
 * Iterative: the input may be nested far beyond what recursion can handle.
 */
bool NestingExceeds(const nlohmann::json& root, size_t limit) {
  std::vector<std::pair<const nlohmann::json*, size_t>> pending{{&root, 1}};
  while (!pending.empty()) {
    auto [value, level] = pending.back();
    pending.pop_back();
    if (!value->is_structured()) {
      continue;
    }
    if (level > limit) {
      return true;
    }
    for (const auto& child : *value) {
      pending.emplace_back(&child, level + 1);
    }
  }
  return false;
}

// Epoch milliseconds representable by utils::Timestamp
constexpr int64_t kMaxTimestampMs =
    std::chrono::duration_cast<std::chrono::milliseconds>(utils::Timestamp::duration::max()).count();
constexpr int64_t kMinTimestampMs =
    std::chrono::duration_cast<std::chrono::milliseconds>(utils::Timestamp::duration::min()).count();

}  // namespace

utils::Expected<Signal, utils::Error> SignalFromJson(const nlohmann::json& doc, utils::Timestamp now) {
  if (!doc.is_object()) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kSignalInvalidField, "signal must be a JSON object"));
  }

  auto code_it = doc.find("code");
  if (code_it == doc.end()) {
    return utils::MakeUnexpected(FieldError(utils::ErrorCode::kSignalMissingField, "code", "is required"));
  }
  if (!code_it->is_string()) {
    return utils::MakeUnexpected(FieldError(utils::ErrorCode::kSignalInvalidField, "code", "must be a string"));
  }

  auto message_it = doc.find("message");
  if (message_it == doc.end()) {
    return utils::MakeUnexpected(FieldError(utils::ErrorCode::kSignalMissingField, "message", "is required"));
  }
  if (!message_it->is_string()) {
    return utils::MakeUnexpected(FieldError(utils::ErrorCode::kSignalInvalidField, "message", "must be a string"));
  }

  int status_code = kDefaultStatusCode;
  auto status_it = doc.find("statusCode");
  if (status_it != doc.end()) {
    if (!status_it->is_number_integer()) {
      return utils::MakeUnexpected(
          FieldError(utils::ErrorCode::kSignalInvalidField, "statusCode", "must be an integer"));
    }
    const bool too_large = status_it->is_number_unsigned() &&
                           status_it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max());
    const auto raw = too_large ? int64_t{0} : status_it->get<int64_t>();
    if (too_large || raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max()) {
      return utils::MakeUnexpected(
          FieldError(utils::ErrorCode::kSignalInvalidField, "statusCode", "is out of range"));
    }
    status_code = static_cast<int>(raw);
  }

  bool operational = true;
  auto operational_it = doc.find("isOperational");
  if (operational_it != doc.end()) {
    if (!operational_it->is_boolean()) {
      return utils::MakeUnexpected(
          FieldError(utils::ErrorCode::kSignalInvalidField, "isOperational", "must be a boolean"));
    }
    operational = operational_it->get<bool>();
  }

  std::optional<nlohmann::json> context;
  auto context_it = doc.find("context");
  if (context_it != doc.end() && !context_it->is_null()) {
    if (!context_it->is_object()) {
      return utils::MakeUnexpected(
          FieldError(utils::ErrorCode::kSignalInvalidField, "context", "must be an object"));
    }
    if (NestingExceeds(*context_it, kMaxContextNesting)) {
      return utils::MakeUnexpected(FieldError(utils::ErrorCode::kSignalInvalidField, "context",
                                              "nesting exceeds " + std::to_string(kMaxContextNesting) + " levels"));
    }
    context = *context_it;
  }

  utils::Timestamp timestamp = now;
  auto timestamp_it = doc.find("timestamp");
  if (timestamp_it != doc.end()) {
    if (!timestamp_it->is_number_integer()) {
      return utils::MakeUnexpected(
          FieldError(utils::ErrorCode::kSignalInvalidField, "timestamp", "must be epoch milliseconds"));
    }
    const bool too_large = timestamp_it->is_number_unsigned() &&
                           timestamp_it->get<uint64_t>() > static_cast<uint64_t>(kMaxTimestampMs);
    const auto millis = too_large ? int64_t{0} : timestamp_it->get<int64_t>();
    if (too_large || millis > kMaxTimestampMs || millis < kMinTimestampMs) {
      return utils::MakeUnexpected(
          FieldError(utils::ErrorCode::kSignalInvalidField, "timestamp", "is out of range"));
    }
    timestamp = utils::Timestamp(std::chrono::milliseconds(millis));
  }

  return Signal(code_it->get<std::string>(), message_it->get<std::string>(), status_code, std::move(context),
                operational, timestamp);
}

utils::Expected<Signal, utils::Error> ParseSignalLine(const std::string& line, utils::Timestamp now) {
  // Depth 0 is the signal object, depth 1 the context object
  bool too_deep = false;
  nlohmann::json::parser_callback_t depth_guard = [&too_deep](int depth, nlohmann::json::parse_event_t event,
                                                              nlohmann::json& /*parsed*/) {
    if ((event == nlohmann::json::parse_event_t::object_start || event == nlohmann::json::parse_event_t::array_start) &&
        depth > static_cast<int>(kMaxContextNesting)) {
      too_deep = true;
      return false;  // Discarded: nothing below this level is built
    }
    return true;
  };

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(line, depth_guard);
  } catch (const nlohmann::json::parse_error& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kSignalParseError, std::string("JSON parse error: ") + e.what()));
  }
  if (too_deep) {
    return utils::MakeUnexpected(FieldError(utils::ErrorCode::kSignalInvalidField, "context",
                                            "nesting exceeds " + std::to_string(kMaxContextNesting) + " levels"));
  }
  return SignalFromJson(doc, now);
}

nlohmann::json SignalToJson(const Signal& signal) {
  nlohmann::json doc = {
      {"code", signal.code()},
      {"message", signal.message()},
      {"statusCode", signal.status_code()},
      {"isOperational", signal.operational()},
      {"severity", SeverityToString(signal.severity())},
      {"timestamp", utils::ToEpochMillis(signal.timestamp())},
  };
  if (signal.has_context()) {
    doc["context"] = *signal.context();
  }
  return doc;
}

}  // namespace errdedup::signal
