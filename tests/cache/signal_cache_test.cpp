/**
 * @file signal_cache_test.cpp
 * @brief Unit tests for SignalCache
 */

#include "cache/signal_cache.h"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "signal/signal_key.h"

namespace errdedup::cache {
namespace {

using std::chrono::milliseconds;

signal::Signal MakeSignal(const std::string& code, int status = 500) {
  return signal::Signal(code, "message for " + code, status);
}

class SignalCacheTest : public ::testing::Test {
 protected:
  void SetUp() override { clock_ = std::make_shared<utils::ManualClock>(1000); }

  std::unique_ptr<SignalCache> MakeCache(size_t max_size = defaults::kMaxSize,
                                         milliseconds ttl = defaults::kTtl) {
    SignalCacheOptions options;
    options.max_size = max_size;
    options.ttl = ttl;
    return std::make_unique<SignalCache>(options, clock_);
  }

  static std::vector<std::string> Codes(const std::vector<CachedEntry>& entries) {
    std::vector<std::string> codes;
    codes.reserve(entries.size());
    for (const auto& entry : entries) {
      codes.push_back(entry.signal.code());
    }
    return codes;
  }

  std::shared_ptr<utils::ManualClock> clock_;
};

// ============================================================================
// Exact and similar matching
// ============================================================================

TEST_F(SignalCacheTest, FirstOccurrenceIsNew) {
  auto cache = MakeCache();
  auto result = cache->AddOccurrence(MakeSignal("DB_ERROR"));

  EXPECT_FALSE(result.is_duplicate);
  EXPECT_EQ(result.entry.count, 1U);
  EXPECT_EQ(result.entry.first_seen, clock_->Now());
  EXPECT_EQ(result.entry.last_seen, clock_->Now());
  EXPECT_EQ(result.previous_last_seen, clock_->Now());
  EXPECT_EQ(cache->Size(), 1U);
}

TEST_F(SignalCacheTest, ExactRepeatsFoldIntoOneEntry) {
  auto cache = MakeCache();
  const auto signal = MakeSignal("DB_ERROR");

  constexpr int kRepeats = 7;
  AddResult last = cache->AddOccurrence(signal);
  for (int i = 1; i < kRepeats; ++i) {
    clock_->Advance(milliseconds(10));
    last = cache->AddOccurrence(signal);
    EXPECT_TRUE(last.is_duplicate);
  }

  EXPECT_EQ(cache->Size(), 1U);
  EXPECT_EQ(last.entry.count, static_cast<uint64_t>(kRepeats));
  EXPECT_EQ(last.entry.last_seen - last.entry.first_seen, milliseconds(60));
  EXPECT_EQ(last.previous_last_seen, last.entry.last_seen - milliseconds(10));
}

TEST_F(SignalCacheTest, QueryFailedTwice) {
  auto cache = MakeCache();
  signal::Signal signal("DB_ERROR", "Query failed", 500);

  EXPECT_FALSE(cache->AddOccurrence(signal).is_duplicate);
  auto second = cache->AddOccurrence(signal);
  EXPECT_TRUE(second.is_duplicate);
  EXPECT_EQ(second.entry.count, 2U);
}

TEST_F(SignalCacheTest, SimilarSignalFoldsIntoExistingEntry) {
  auto cache = MakeCache();
  signal::Signal original("DB_ERROR", "Connection timed out", 500);
  signal::Signal variant("DB_ERROR", "Connection timed ou!", 500);

  cache->AddOccurrence(original);
  auto result = cache->AddOccurrence(variant);

  EXPECT_TRUE(result.is_duplicate);
  EXPECT_EQ(result.entry.key, signal::DeriveKey(original));
  EXPECT_EQ(result.entry.signal.message(), "Connection timed out");
  EXPECT_EQ(result.entry.count, 2U);
  EXPECT_EQ(cache->Size(), 1U);
  EXPECT_FALSE(cache->Get(signal::DeriveKey(variant)).has_value());
}

TEST_F(SignalCacheTest, SignalAtThresholdFolds) {
  auto cache = MakeCache();
  signal::Signal original("DB_ERROR", "Query failed", 500, nlohmann::json{{"table", "users"}});
  signal::Signal retried("DB_ERROR", "Query failed", 503, nlohmann::json{{"table", "users"}, {"attempt", 2}});

  cache->AddOccurrence(original);
  auto result = cache->AddOccurrence(retried);

  EXPECT_TRUE(result.is_duplicate);
  EXPECT_EQ(result.entry.key, signal::DeriveKey(original));
  EXPECT_EQ(result.entry.count, 2U);
  EXPECT_EQ(cache->Size(), 1U);
}

TEST_F(SignalCacheTest, CustomKeyGenerator) {
  SignalCacheOptions options;
  options.key_generator = [](const signal::Signal& signal) { return "code:" + signal.code(); };
  SignalCache cache(options, clock_);

  signal::Signal first("DB_ERROR", "Query failed", 500);
  signal::Signal second("DB_ERROR", "Deadlock detected on orders", 409);
  EXPECT_EQ(cache.KeyFor(first), "code:DB_ERROR");

  EXPECT_FALSE(cache.IsDuplicate(first));
  cache.AddOccurrence(first);
  EXPECT_TRUE(cache.IsDuplicate(second));

  auto result = cache.AddOccurrence(second);
  EXPECT_TRUE(result.is_duplicate);
  EXPECT_EQ(result.entry.key, "code:DB_ERROR");
  EXPECT_EQ(result.entry.count, 2U);

  ASSERT_TRUE(cache.Get("code:DB_ERROR").has_value());
  EXPECT_FALSE(cache.Get(signal::DeriveKey(first)).has_value());
}

TEST_F(SignalCacheTest, DefaultKeyGeneratorIsDeriveKey) {
  auto cache = MakeCache();
  signal::Signal signal("DB_ERROR", "Query failed", 500, nlohmann::json{{"table", "users"}});
  EXPECT_EQ(cache->KeyFor(signal), signal::DeriveKey(signal));
}

TEST_F(SignalCacheTest, UnrelatedSignalsStayDistinct) {
  auto cache = MakeCache();
  cache->AddOccurrence(signal::Signal("DB_ERROR", "Query failed", 500));
  auto result = cache->AddOccurrence(signal::Signal("AUTH_ERROR", "Token expired", 401));

  EXPECT_FALSE(result.is_duplicate);
  EXPECT_EQ(cache->Size(), 2U);
}

TEST_F(SignalCacheTest, SimilarityScanPrefersNewestEntry) {
  auto cache = MakeCache();
  // Not similar to each other (0.7), both similar to the incoming signal (0.85)
  signal::Signal older("E", "aaaaaaaaaa", 500);
  signal::Signal newer("E", "bbbbbbbbbb", 500);
  signal::Signal incoming("E", "aaaaabbbbb", 500);

  cache->AddOccurrence(older);
  cache->AddOccurrence(newer);
  ASSERT_EQ(cache->Size(), 2U);

  auto result = cache->AddOccurrence(incoming);
  EXPECT_TRUE(result.is_duplicate);
  EXPECT_EQ(result.entry.key, signal::DeriveKey(newer));
}

TEST_F(SignalCacheTest, IsDuplicateDoesNotRecord) {
  auto cache = MakeCache();
  const auto signal = MakeSignal("DB_ERROR");

  EXPECT_FALSE(cache->IsDuplicate(signal));
  cache->AddOccurrence(signal);
  EXPECT_TRUE(cache->IsDuplicate(signal));
  EXPECT_TRUE(cache->IsDuplicate(MakeSignal("DB_ERROR", 500)));
  EXPECT_FALSE(cache->IsDuplicate(signal::Signal("AUTH_ERROR", "Token expired", 401)));

  EXPECT_EQ(cache->Get(signal::DeriveKey(signal))->count, 1U);
}

// ============================================================================
// Lookup and removal
// ============================================================================

TEST_F(SignalCacheTest, GetAndRemove) {
  auto cache = MakeCache();
  const auto signal = MakeSignal("DB_ERROR");
  const auto key = signal::DeriveKey(signal);
  cache->AddOccurrence(signal);

  auto entry = cache->Get(key);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->signal.code(), "DB_ERROR");

  EXPECT_FALSE(cache->Get("missing").has_value());
  EXPECT_FALSE(cache->Remove("missing"));

  EXPECT_TRUE(cache->Remove(key));
  EXPECT_FALSE(cache->Get(key).has_value());
  EXPECT_EQ(cache->Size(), 0U);
}

TEST_F(SignalCacheTest, ClearRemovesEverything) {
  auto cache = MakeCache();
  cache->AddOccurrence(MakeSignal("E1"));
  cache->AddOccurrence(MakeSignal("E2"));

  cache->Clear();
  EXPECT_EQ(cache->Size(), 0U);
  EXPECT_TRUE(cache->GetAll().empty());
}

TEST_F(SignalCacheTest, GetAllInInsertionOrder) {
  auto cache = MakeCache();
  cache->AddOccurrence(MakeSignal("E1"));
  cache->AddOccurrence(MakeSignal("E2"));
  cache->AddOccurrence(MakeSignal("E3"));
  cache->AddOccurrence(MakeSignal("E1"));

  EXPECT_EQ(Codes(cache->GetAll()), (std::vector<std::string>{"E1", "E2", "E3"}));
}

TEST_F(SignalCacheTest, FilterByCodeAndSeverity) {
  auto cache = MakeCache();
  cache->AddOccurrence(signal::Signal("DB_ERROR", "Query failed", 500));
  cache->AddOccurrence(signal::Signal("DB_ERROR", "Deadlock detected in transaction", 503,
                                      nlohmann::json{{"table", "orders"}}));
  cache->AddOccurrence(signal::Signal("NOT_FOUND", "User not found", 404));
  cache->AddOccurrence(signal::Signal("REDIRECT", "Moved permanently", 301));

  EXPECT_EQ(cache->GetByCode("DB_ERROR").size(), 2U);
  EXPECT_TRUE(cache->GetByCode("UNKNOWN").empty());

  EXPECT_EQ(cache->GetBySeverity(signal::Severity::kCritical).size(), 2U);
  EXPECT_EQ(Codes(cache->GetBySeverity(signal::Severity::kHigh)), (std::vector<std::string>{"NOT_FOUND"}));
  EXPECT_EQ(Codes(cache->GetBySeverity(signal::Severity::kMedium)), (std::vector<std::string>{"REDIRECT"}));
  EXPECT_TRUE(cache->GetBySeverity(signal::Severity::kLow).empty());
}

// ============================================================================
// Ranking
// ============================================================================

TEST_F(SignalCacheTest, MostFrequentOrdersByCountThenInsertion) {
  auto cache = MakeCache();
  cache->AddOccurrence(MakeSignal("E1"));
  cache->AddOccurrence(MakeSignal("E2"));
  cache->AddOccurrence(MakeSignal("E3"));
  cache->AddOccurrence(MakeSignal("E4"));
  for (int i = 0; i < 3; ++i) {
    cache->AddOccurrence(MakeSignal("E3"));
  }
  cache->AddOccurrence(MakeSignal("E2"));

  EXPECT_EQ(Codes(cache->GetMostFrequent(10)), (std::vector<std::string>{"E3", "E2", "E1", "E4"}));
  EXPECT_EQ(Codes(cache->GetMostFrequent(2)), (std::vector<std::string>{"E3", "E2"}));
  EXPECT_TRUE(cache->GetMostFrequent(0).empty());
}

TEST_F(SignalCacheTest, MostRecentOrdersByLastSeen) {
  auto cache = MakeCache();
  cache->AddOccurrence(MakeSignal("E1"));
  clock_->Advance(milliseconds(10));
  cache->AddOccurrence(MakeSignal("E2"));
  clock_->Advance(milliseconds(10));
  cache->AddOccurrence(MakeSignal("E3"));
  clock_->Advance(milliseconds(10));
  cache->AddOccurrence(MakeSignal("E1"));

  EXPECT_EQ(Codes(cache->GetMostRecent(10)), (std::vector<std::string>{"E1", "E3", "E2"}));
  EXPECT_EQ(Codes(cache->GetMostRecent(1)), (std::vector<std::string>{"E1"}));
}

TEST_F(SignalCacheTest, MostRecentTiesFavourLaterInsertion) {
  auto cache = MakeCache();
  cache->AddOccurrence(MakeSignal("E1"));
  cache->AddOccurrence(MakeSignal("E2"));
  cache->AddOccurrence(MakeSignal("E3"));

  EXPECT_EQ(Codes(cache->GetMostRecent(10)), (std::vector<std::string>{"E3", "E2", "E1"}));
}

// ============================================================================
// Capacity eviction
// ============================================================================

TEST_F(SignalCacheTest, CapacityEvictsOldestInsertion) {
  auto cache = MakeCache(2);
  cache->AddOccurrence(MakeSignal("A"));
  cache->AddOccurrence(MakeSignal("B"));
  cache->AddOccurrence(MakeSignal("C"));

  EXPECT_EQ(cache->Size(), 2U);
  EXPECT_EQ(Codes(cache->GetAll()), (std::vector<std::string>{"B", "C"}));
  EXPECT_EQ(cache->GetStatistics().evictions, 1U);
}

TEST_F(SignalCacheTest, RepeatsDoNotRefreshEvictionOrder) {
  auto cache = MakeCache(2);
  cache->AddOccurrence(MakeSignal("A"));
  cache->AddOccurrence(MakeSignal("B"));
  cache->AddOccurrence(MakeSignal("A"));
  cache->AddOccurrence(MakeSignal("C"));

  EXPECT_EQ(Codes(cache->GetAll()), (std::vector<std::string>{"B", "C"}));
}

TEST_F(SignalCacheTest, SizeNeverExceedsCapacity) {
  constexpr size_t kCapacity = 5;
  constexpr size_t kExtra = 8;
  auto cache = MakeCache(kCapacity);

  for (size_t i = 0; i < kCapacity + kExtra; ++i) {
    cache->AddOccurrence(MakeSignal("CODE_" + std::to_string(i)));
    EXPECT_LE(cache->Size(), kCapacity);
  }

  // The kExtra oldest are gone, the newest kCapacity remain
  auto codes = Codes(cache->GetAll());
  ASSERT_EQ(codes.size(), kCapacity);
  for (size_t i = 0; i < kCapacity; ++i) {
    EXPECT_EQ(codes[i], "CODE_" + std::to_string(kExtra + i));
  }
  EXPECT_EQ(cache->GetStatistics().evictions, kExtra);
}

// ============================================================================
// TTL expiry
// ============================================================================

TEST_F(SignalCacheTest, ClearExpiredIsStrict) {
  auto cache = MakeCache(defaults::kMaxSize, milliseconds(1000));
  cache->AddOccurrence(MakeSignal("E1"));

  clock_->Advance(milliseconds(1000));
  EXPECT_EQ(cache->ClearExpired(), 0U);
  EXPECT_EQ(cache->Size(), 1U);

  clock_->Advance(milliseconds(1));
  EXPECT_EQ(cache->ClearExpired(), 1U);
  EXPECT_EQ(cache->Size(), 0U);
  EXPECT_EQ(cache->GetStatistics().expirations, 1U);
}

TEST_F(SignalCacheTest, ExpiryMeasuredFromFirstSeen) {
  auto cache = MakeCache(defaults::kMaxSize, milliseconds(1000));
  const auto signal = MakeSignal("E1");
  cache->AddOccurrence(signal);

  // Repeats keep the entry busy but do not extend its lifetime
  clock_->Advance(milliseconds(900));
  cache->AddOccurrence(signal);
  clock_->Advance(milliseconds(200));

  EXPECT_EQ(cache->ClearExpired(), 1U);
}

TEST_F(SignalCacheTest, InsertionSweepsExpiredEntries) {
  auto cache = MakeCache(defaults::kMaxSize, milliseconds(1000));
  cache->AddOccurrence(MakeSignal("OLD"));
  clock_->Advance(milliseconds(1500));
  cache->AddOccurrence(MakeSignal("NEW"));

  EXPECT_EQ(Codes(cache->GetAll()), (std::vector<std::string>{"NEW"}));
}

TEST_F(SignalCacheTest, ExpiredEntryStillMatchesUntilSwept) {
  auto cache = MakeCache(defaults::kMaxSize, milliseconds(1000));
  const auto signal = MakeSignal("E1");
  cache->AddOccurrence(signal);
  clock_->Advance(milliseconds(5000));

  auto result = cache->AddOccurrence(signal);
  EXPECT_TRUE(result.is_duplicate);
  EXPECT_EQ(result.entry.count, 2U);
}

// ============================================================================
// Statistics and concurrency
// ============================================================================

TEST_F(SignalCacheTest, StatisticsReflectEntries) {
  auto cache = MakeCache();
  const auto first_time = clock_->Now();
  cache->AddOccurrence(MakeSignal("E1"));
  cache->AddOccurrence(MakeSignal("E1"));
  cache->AddOccurrence(MakeSignal("E1"));
  clock_->Advance(milliseconds(50));
  cache->AddOccurrence(MakeSignal("E2"));
  clock_->Advance(milliseconds(50));
  cache->AddOccurrence(MakeSignal("E3"));

  auto stats = cache->GetStatistics();
  EXPECT_EQ(stats.total_errors, 5U);
  EXPECT_EQ(stats.unique_errors, 3U);
  EXPECT_EQ(stats.duplicate_errors, 2U);
  EXPECT_DOUBLE_EQ(stats.hit_rate, 0.4);
  ASSERT_TRUE(stats.oldest_error.has_value());
  ASSERT_TRUE(stats.newest_error.has_value());
  EXPECT_EQ(*stats.oldest_error, first_time);
  EXPECT_EQ(*stats.newest_error, first_time + milliseconds(100));
}

TEST_F(SignalCacheTest, ConcurrentRepeatsAreAllCounted) {
  auto cache = MakeCache();
  const auto signal = MakeSignal("DB_ERROR");

  constexpr int kThreads = 4;
  constexpr int kPerThread = 250;
  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < kPerThread; ++i) {
        cache->AddOccurrence(signal);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(cache->Size(), 1U);
  EXPECT_EQ(cache->Get(signal::DeriveKey(signal))->count, static_cast<uint64_t>(kThreads * kPerThread));
}

}  // namespace
}  // namespace errdedup::cache
