/**
 * @file signal_key.h
 * @brief Exact-match deduplication key for signals
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "signal/signal.h"

namespace errdedup::signal {

/**
 * @brief Derive the exact-match key of a signal
 *
 * Format: "<code>:<message>:<context>" where <context> is the compact JSON
 * dump of the context (empty when absent). nlohmann::json objects keep their
 * keys sorted at every depth, so the dump does not depend on the order in
 * which context fields were inserted.
 *
 * Status code and severity do not participate.
 *
 * @param signal Signal to key
 * @return Deterministic key string
 */
std::string DeriveKey(const Signal& signal);

/**
 * @brief Canonical serialization of a context value ("" for absent)
 */
std::string CanonicalContext(const std::optional<nlohmann::json>& context);

}  // namespace errdedup::signal
