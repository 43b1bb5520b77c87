/**
 * @file signal_json.h
 * @brief JSON decoding/encoding of signals and cache entries
 *
 * Wire shape (one object per signal):
 * @code
 * {"code":"DATABASE_ERROR","message":"Query failed","statusCode":500,
 *  "isOperational":true,"context":{"table":"users"},"timestamp":1700000000000}
 * @endcode
 * Only "code" and "message" are required. "statusCode" defaults to 500,
 * "isOperational" to true, "timestamp" (epoch ms) to the supplied time.
 */

#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "signal/signal.h"
#include "utils/clock.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace errdedup::signal {

/// Status code used when the input omits one
constexpr int kDefaultStatusCode = 500;

/// Deepest container nesting accepted in "context" (the context object itself is level 1)
constexpr size_t kMaxContextNesting = 64;

/**
 * @brief Decode a signal from a parsed JSON object
 * @param doc JSON document
 * @param now Timestamp to use when the document has none
 * @return Signal or kSignalMissingField / kSignalInvalidField
 *
 * A context nested deeper than kMaxContextNesting, an out-of-range
 * statusCode and a timestamp outside the clock's range are rejected as
 * kSignalInvalidField.
 */
utils::Expected<Signal, utils::Error> SignalFromJson(const nlohmann::json& doc, utils::Timestamp now);

/**
 * @brief Parse and decode one JSON line
 *
 * Nesting is checked while parsing, so an over-deep document is never
 * materialized.
 *
 * @return Signal or kSignalParseError when the text is not valid JSON
 */
utils::Expected<Signal, utils::Error> ParseSignalLine(const std::string& line, utils::Timestamp now);

/**
 * @brief Encode a signal (severity included for readability)
 */
nlohmann::json SignalToJson(const Signal& signal);

}  // namespace errdedup::signal
