// Repository: SkipTV
// Component: TTL/LRU cache unit tests

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "skiptv/cache/TtlLruCache.hpp"
#include "support/DeterministicTimeSource.hpp"

namespace skiptv::cache {
namespace {

using std::chrono::milliseconds;

class TtlLruCacheTest : public ::testing::Test {
 protected:
  std::shared_ptr<DeterministicTimeSource> clock_ = std::make_shared<DeterministicTimeSource>();
};

TEST_F(TtlLruCacheTest, GetAfterSetReturnsValue) {
  TtlLruCache<int> cache(4, milliseconds(1000), clock_);
  cache.Set("a", 7, false);
  auto value = cache.Get("a");
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 7);
  EXPECT_FALSE(cache.Get("missing").has_value());
}

TEST_F(TtlLruCacheTest, NonPermanentEntryExpiresAfterTtl) {
  TtlLruCache<int> cache(4, milliseconds(1000), clock_);
  cache.Set("a", 1, false);

  clock_->AdvanceMs(999);
  EXPECT_TRUE(cache.Get("a").has_value());

  clock_->AdvanceMs(1);
  EXPECT_FALSE(cache.Get("a").has_value());
  EXPECT_EQ(cache.Size(), 0u) << "expired entry must be physically removed";
  EXPECT_EQ(cache.GetStats().expirations, 1u);
}

TEST_F(TtlLruCacheTest, PermanentEntryNeverExpires) {
  TtlLruCache<int> cache(4, milliseconds(1000), clock_);
  cache.Set("a", 1, true);
  clock_->AdvanceMs(24 * 3600 * 1000);
  EXPECT_TRUE(cache.Get("a").has_value());
}

TEST_F(TtlLruCacheTest, ZeroTtlDisablesExpiry) {
  TtlLruCache<int> cache(4, milliseconds(0), clock_);
  cache.Set("a", 1, false);
  clock_->AdvanceMs(10'000'000);
  EXPECT_TRUE(cache.Get("a").has_value());
}

TEST_F(TtlLruCacheTest, EvictsLeastRecentlyUsed) {
  TtlLruCache<int> cache(2, milliseconds(0), clock_);
  cache.Set("a", 1, false);
  cache.Set("b", 2, false);
  cache.Set("c", 3, false);

  EXPECT_FALSE(cache.Get("a").has_value());
  EXPECT_TRUE(cache.Get("b").has_value());
  EXPECT_TRUE(cache.Get("c").has_value());
  EXPECT_EQ(cache.GetStats().evictions, 1u);
}

TEST_F(TtlLruCacheTest, GetRefreshesRecency) {
  TtlLruCache<int> cache(2, milliseconds(0), clock_);
  cache.Set("a", 1, false);
  cache.Set("b", 2, false);
  ASSERT_TRUE(cache.Get("a").has_value());
  cache.Set("c", 3, false);

  EXPECT_TRUE(cache.Get("a").has_value());
  EXPECT_FALSE(cache.Get("b").has_value()) << "b was least recently used";
}

TEST_F(TtlLruCacheTest, RefreshingSetUpdatesValueAndRecency) {
  TtlLruCache<int> cache(2, milliseconds(1000), clock_);
  cache.Set("a", 1, false);
  cache.Set("b", 2, false);
  clock_->AdvanceMs(900);
  cache.Set("a", 10, false);
  cache.Set("c", 3, false);

  EXPECT_FALSE(cache.Get("b").has_value());
  clock_->AdvanceMs(500);
  auto a = cache.Get("a");
  ASSERT_TRUE(a.has_value()) << "refresh restarts the TTL";
  EXPECT_EQ(*a, 10);
}

TEST_F(TtlLruCacheTest, ZeroCapacityIsUnbounded) {
  TtlLruCache<int> cache(0, milliseconds(0), clock_);
  for (int i = 0; i < 500; ++i) cache.Set("k" + std::to_string(i), i, false);
  EXPECT_EQ(cache.Size(), 500u);
  EXPECT_TRUE(cache.Get("k0").has_value());
}

TEST_F(TtlLruCacheTest, DeleteAndClear) {
  TtlLruCache<std::string> cache(4, milliseconds(0), clock_);
  cache.Set("a", "x", false);
  cache.Set("b", "y", false);

  EXPECT_TRUE(cache.Delete("a"));
  EXPECT_FALSE(cache.Delete("a"));
  EXPECT_FALSE(cache.Get("a").has_value());

  cache.Clear();
  EXPECT_EQ(cache.Size(), 0u);
  EXPECT_FALSE(cache.Get("b").has_value());
}

TEST_F(TtlLruCacheTest, NullTimeSourceIsRejected) {
  EXPECT_THROW(TtlLruCache<int>(1, milliseconds(0), nullptr), std::invalid_argument);
}

TEST_F(TtlLruCacheTest, ConcurrentAccessKeepsCapacityBound) {
  TtlLruCache<int> cache(8, milliseconds(0), clock_);
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&cache, t] {
      for (int i = 0; i < 2000; ++i) {
        const std::string key = "k" + std::to_string((i * 7 + t) % 20);
        if (i % 3 == 0) {
          cache.Set(key, i, false);
        } else if (i % 11 == 0) {
          cache.Delete(key);
        } else {
          cache.Get(key);
        }
      }
    });
  }
  for (auto& th : threads) th.join();
  EXPECT_LE(cache.Size(), 8u);
}

}  // namespace
}  // namespace skiptv::cache
