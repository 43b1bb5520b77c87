/**
 * @file cache_entry.h
 * @brief Cached record of a unique error signature
 */

#pragma once

#include <cstdint>
#include <string>

#include "signal/signal.h"
#include "utils/clock.h"

namespace errdedup::cache {

/**
 * @brief One unique signature and its repeat count
 *
 * Owns the first signal that established the entry. Values handed out by
 * SignalCache are snapshots; mutating them does not affect the cache.
 *
 * Invariants: count >= 1, last_seen >= first_seen.
 */
struct CachedEntry {
  std::string key;             ///< Exact-match key computed at insertion
  signal::Signal signal;       ///< First occurrence
  uint64_t count = 1;          ///< Number of occurrences folded into this entry
  utils::Timestamp first_seen;  ///< Creation time (immutable)
  utils::Timestamp last_seen;   ///< Most recent match
  uint64_t sequence = 0;       ///< Insertion sequence (tie-breaks)

  CachedEntry(std::string key_, signal::Signal signal_, utils::Timestamp now, uint64_t sequence_)
      : key(std::move(key_)),
        signal(std::move(signal_)),
        first_seen(now),
        last_seen(now),
        sequence(sequence_) {}
};

}  // namespace errdedup::cache
