/**
 * @file signal_similarity.cpp
 * @brief Signal similarity implementation
 */

#include "similarity/signal_similarity.h"

#include <algorithm>
#include <numeric>
#include <vector>

namespace errdedup::similarity {

size_t EditDistance(const std::string& lhs, const std::string& rhs) {
  // Keep the shorter string on the row axis to bound memory
  const std::string& row_str = lhs.size() <= rhs.size() ? lhs : rhs;
  const std::string& col_str = lhs.size() <= rhs.size() ? rhs : lhs;

  if (row_str.empty()) {
    return col_str.size();
  }

  // Single rolling row of the DP matrix
  std::vector<size_t> row(row_str.size() + 1);
  std::iota(row.begin(), row.end(), 0);

  for (size_t j = 1; j <= col_str.size(); ++j) {
    size_t diagonal = row[0];  // row[j-1][i-1]
    row[0] = j;
    for (size_t i = 1; i <= row_str.size(); ++i) {
      const size_t above = row[i];
      const size_t substitution = diagonal + (row_str[i - 1] == col_str[j - 1] ? 0 : 1);
      row[i] = std::min({row[i - 1] + 1, above + 1, substitution});
      diagonal = above;
    }
  }

  return row[row_str.size()];
}

double MessageSimilarity(const std::string& lhs, const std::string& rhs) {
  const size_t max_length = std::max(lhs.size(), rhs.size());
  if (max_length == 0) {
    return 1.0;
  }
  const size_t distance = EditDistance(lhs, rhs);
  return 1.0 - static_cast<double>(distance) / static_cast<double>(max_length);
}

namespace {

bool ValuesEqual(const nlohmann::json& lhs, const nlohmann::json& rhs, size_t remaining_depth) {
  if (lhs.is_structured() || rhs.is_structured()) {
    if (remaining_depth == 0) {
      return false;  // Fail closed past the nesting bound
    }
    if (lhs.type() != rhs.type() || lhs.size() != rhs.size()) {
      return false;
    }
    if (lhs.is_array()) {
      for (size_t i = 0; i < lhs.size(); ++i) {
        if (!ValuesEqual(lhs[i], rhs[i], remaining_depth - 1)) {
          return false;
        }
      }
      return true;
    }
    for (auto it = lhs.begin(); it != lhs.end(); ++it) {
      auto other = rhs.find(it.key());
      if (other == rhs.end() || !ValuesEqual(it.value(), *other, remaining_depth - 1)) {
        return false;
      }
    }
    return true;
  }

  // Scalars: nlohmann compares integer/unsigned/float numerically
  return lhs == rhs;
}

}  // namespace

bool ContextValuesEqual(const nlohmann::json& lhs, const nlohmann::json& rhs, size_t max_depth) {
  return ValuesEqual(lhs, rhs, max_depth);
}

double ContextSimilarity(const std::optional<nlohmann::json>& lhs, const std::optional<nlohmann::json>& rhs,
                         size_t max_depth) {
  const bool lhs_absent = !lhs.has_value() || lhs->is_null();
  const bool rhs_absent = !rhs.has_value() || rhs->is_null();
  if (lhs_absent && rhs_absent) {
    return 1.0;
  }
  if (lhs_absent || rhs_absent) {
    return 0.0;
  }

  if (!lhs->is_object() || !rhs->is_object()) {
    return ValuesEqual(*lhs, *rhs, max_depth) ? 1.0 : 0.0;
  }

  size_t common_keys = 0;
  size_t equal_values = 0;
  for (auto it = lhs->begin(); it != lhs->end(); ++it) {
    auto other = rhs->find(it.key());
    if (other == rhs->end()) {
      continue;
    }
    ++common_keys;
    if (ValuesEqual(it.value(), *other, max_depth)) {
      ++equal_values;
    }
  }

  if (common_keys == 0) {
    return 0.0;
  }
  return static_cast<double>(equal_values) / static_cast<double>(common_keys);
}

double SignalSimilarity::Score(const signal::Signal& lhs, const signal::Signal& rhs) const {
  double score = 0.0;

  if (lhs.code() == rhs.code()) {
    score += weights::kCode;
  }

  score += weights::kMessage * MessageSimilarity(lhs.message(), rhs.message());

  if (lhs.status_code() == rhs.status_code()) {
    score += weights::kStatus;
  }

  score += weights::kContext * ContextSimilarity(lhs.context(), rhs.context(), max_context_depth_);

  return std::clamp(score, 0.0, 1.0);
}

}  // namespace errdedup::similarity
