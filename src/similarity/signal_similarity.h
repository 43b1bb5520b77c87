/**
 * @file signal_similarity.h
 * @brief Weighted similarity between two signals
 *
 * Used only when an incoming signal has no exact key match, to decide whether
 * it should be folded into an existing entry.
 *
 * score = 0.4 * [code equal]
 *       + 0.3 * message similarity (normalized Levenshtein)
 *       + 0.2 * [status equal]
 *       + 0.1 * context similarity (share of common keys with equal values)
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "signal/signal.h"

namespace errdedup::similarity {

namespace weights {

constexpr double kCode = 0.4;
constexpr double kMessage = 0.3;
constexpr double kStatus = 0.2;
constexpr double kContext = 0.1;

}  // namespace weights

/// Default duplicate threshold
constexpr double kDefaultSimilarityThreshold = 0.8;

/// Default nesting bound for context value comparison
constexpr size_t kDefaultMaxContextDepth = 16;

/// Tolerance for the threshold comparison (weighted sums are inexact, e.g. 0.4 + 0.3 + 0.1)
constexpr double kScoreEpsilon = 1e-9;

/**
 * @brief Levenshtein distance (unit cost insert/delete/substitute)
 *
 * Byte-wise; O(len(a) * len(b)) time, O(min(len)) memory.
 */
size_t EditDistance(const std::string& lhs, const std::string& rhs);

/**
 * @brief 1 - EditDistance / max(len); two empty strings score 1
 */
double MessageSimilarity(const std::string& lhs, const std::string& rhs);

/**
 * @brief Deep equality of two JSON values, bounded by depth
 *
 * Containers nested deeper than max_depth compare as NOT equal.
 */
bool ContextValuesEqual(const nlohmann::json& lhs, const nlohmann::json& rhs, size_t max_depth);

/**
 * @brief Share of common context keys whose values are equal
 *
 * - both absent: 1
 * - exactly one absent: 0
 * - no common keys: 0
 * Non-object contexts are compared as a single opaque value (1 or 0).
 */
double ContextSimilarity(const std::optional<nlohmann::json>& lhs, const std::optional<nlohmann::json>& rhs,
                         size_t max_depth = kDefaultMaxContextDepth);

/**
 * @brief Scores signal pairs against a threshold
 *
 * Stateless apart from its configuration; safe to share between threads.
 */
class SignalSimilarity {
 public:
  explicit SignalSimilarity(double threshold = kDefaultSimilarityThreshold,
                            size_t max_context_depth = kDefaultMaxContextDepth)
      : threshold_(threshold), max_context_depth_(max_context_depth) {}

  /**
   * @brief Weighted similarity in [0, 1]
   */
  [[nodiscard]] double Score(const signal::Signal& lhs, const signal::Signal& rhs) const;

  /**
   * @brief Score(lhs, rhs) >= threshold, within kScoreEpsilon
   */
  [[nodiscard]] bool IsSimilar(const signal::Signal& lhs, const signal::Signal& rhs) const {
    return Score(lhs, rhs) + kScoreEpsilon >= threshold_;
  }

  [[nodiscard]] double threshold() const { return threshold_; }
  [[nodiscard]] size_t max_context_depth() const { return max_context_depth_; }

 private:
  double threshold_;
  size_t max_context_depth_;
};

}  // namespace errdedup::similarity
