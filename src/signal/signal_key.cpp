/**
 * @file signal_key.cpp
 * @brief Signal key derivation
 */

#include "signal/signal_key.h"

namespace errdedup::signal {

std::string CanonicalContext(const std::optional<nlohmann::json>& context) {
  if (!context.has_value() || context->is_null()) {
    return "";
  }
  // Replace invalid UTF-8 instead of throwing: keying must be total
  return context->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string DeriveKey(const Signal& signal) {
  // Format: "<code>:<message>:<context>"
  std::string key;
  key.reserve(signal.code().size() + signal.message().size() + 2);
  key += signal.code();
  key += ':';
  key += signal.message();
  key += ':';
  key += CanonicalContext(signal.context());
  return key;
}

}  // namespace errdedup::signal
