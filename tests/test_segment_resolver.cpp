// Repository: SkipTV
// Component: Segment resolver unit tests

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "fixtures/StubSegmentSources.h"
#include "skiptv/segments/SegmentResolver.hpp"
#include "support/DeterministicTimeSource.hpp"

namespace skiptv::segments {
namespace {

using skiptv::tests::fixtures::StubChannelLookup;
using skiptv::tests::fixtures::StubSegmentProvider;
using std::chrono::minutes;
using std::chrono::hours;

RawSegment Raw(double start, double end, const std::string& id, bool locked = false) {
  RawSegment r;
  r.start_sec = start;
  r.end_sec = end;
  r.id = id;
  r.locked = locked;
  return r;
}

class SegmentResolverTest : public ::testing::Test {
 protected:
  void SetUp() override {
    clock_ = std::make_shared<DeterministicTimeSource>();
    provider_ = std::make_shared<StubSegmentProvider>();
    lookup_ = std::make_shared<StubChannelLookup>();
    segment_cache_ = std::make_shared<SegmentCache>(10, minutes(5), clock_);
    channel_cache_ = std::make_shared<ChannelCache>(100, hours(1), clock_);
  }

  std::unique_ptr<SegmentResolver> MakeResolver(bool with_lookup,
                                                std::vector<std::string> whitelist = {}) {
    ResolverOptions options;
    options.categories = {"sponsor", "selfpromo"};
    options.channel_whitelist = std::move(whitelist);
    return std::make_unique<SegmentResolver>(provider_, with_lookup ? lookup_ : nullptr,
                                             segment_cache_, channel_cache_, options);
  }

  std::shared_ptr<DeterministicTimeSource> clock_;
  std::shared_ptr<StubSegmentProvider> provider_;
  std::shared_ptr<StubChannelLookup> lookup_;
  std::shared_ptr<SegmentCache> segment_cache_;
  std::shared_ptr<ChannelCache> channel_cache_;
};

TEST_F(SegmentResolverTest, FetchesMergesAndCaches) {
  provider_->SetSegments("vid", {Raw(8, 20, "b"), Raw(0, 10, "a")});
  auto resolver = MakeResolver(false);

  SegmentSet first = resolver->Resolve("vid");
  ASSERT_EQ(first.segments.size(), 1u);
  EXPECT_EQ(first.segments[0].end, 20.0);
  EXPECT_EQ(provider_->last_categories(),
            (std::vector<std::string>{"sponsor", "selfpromo"}));

  SegmentSet second = resolver->Resolve("vid");
  EXPECT_EQ(first, second);
  EXPECT_EQ(provider_->calls(), 1) << "second resolve must be served from cache";
}

TEST_F(SegmentResolverTest, UnlockedResultExpiresWithTtl) {
  provider_->SetSegments("vid", {Raw(0, 10, "a")});
  auto resolver = MakeResolver(false);

  resolver->Resolve("vid");
  clock_->AdvanceMs(5 * 60 * 1000);
  resolver->Resolve("vid");
  EXPECT_EQ(provider_->calls(), 2);
}

TEST_F(SegmentResolverTest, LockedResultIsCachedPermanently) {
  provider_->SetSegments("vid", {Raw(0, 10, "a", true)});
  auto resolver = MakeResolver(false);

  EXPECT_TRUE(resolver->Resolve("vid").permanent);
  clock_->AdvanceMs(10 * 60 * 1000);
  resolver->Resolve("vid");
  EXPECT_EQ(provider_->calls(), 1);
}

TEST_F(SegmentResolverTest, ProviderFailurePropagatesAndCachesNothing) {
  provider_->SetFailure(true);
  auto resolver = MakeResolver(false);

  EXPECT_THROW(resolver->Resolve("vid"), std::runtime_error);
  EXPECT_EQ(segment_cache_->Size(), 0u);

  provider_->SetFailure(false);
  provider_->SetSegments("vid", {Raw(1, 2, "a")});
  EXPECT_EQ(resolver->Resolve("vid").segments.size(), 1u);
  EXPECT_EQ(provider_->calls(), 2);
}

TEST_F(SegmentResolverTest, EmptyVideoIdIsRejected) {
  auto resolver = MakeResolver(false);
  EXPECT_THROW(resolver->Resolve(""), SegmentLookupError);
  EXPECT_EQ(provider_->calls(), 0);
}

TEST_F(SegmentResolverTest, WhitelistedChannelYieldsEmptyPermanentSet) {
  provider_->SetSegments("vid", {Raw(0, 10, "a")});
  lookup_->SetChannel("vid", "UC_friend");
  auto resolver = MakeResolver(true, {"UC_friend"});
  ASSERT_TRUE(resolver->WhitelistActive());

  SegmentSet set = resolver->Resolve("vid");
  EXPECT_TRUE(set.empty());
  EXPECT_TRUE(set.permanent);
  EXPECT_EQ(provider_->calls(), 0);

  clock_->AdvanceMs(60 * 60 * 1000);
  resolver->Resolve("vid");
  EXPECT_EQ(lookup_->calls(), 1) << "whitelisted result is cached permanently";
}

TEST_F(SegmentResolverTest, NonWhitelistedChannelFallsThroughToProvider) {
  provider_->SetSegments("vid", {Raw(0, 10, "a")});
  lookup_->SetChannel("vid", "UC_other");
  auto resolver = MakeResolver(true, {"UC_friend"});

  EXPECT_EQ(resolver->Resolve("vid").segments.size(), 1u);
  EXPECT_EQ(provider_->calls(), 1);
  EXPECT_EQ(channel_cache_->Get("vid").value_or(""), "UC_other");
}

TEST_F(SegmentResolverTest, ChannelCacheAvoidsRepeatLookups) {
  lookup_->SetChannel("vid", "UC_other");
  auto resolver = MakeResolver(true, {"UC_friend"});

  EXPECT_FALSE(resolver->IsWhitelisted("vid"));
  EXPECT_FALSE(resolver->IsWhitelisted("vid"));
  EXPECT_EQ(lookup_->calls(), 1);
}

TEST_F(SegmentResolverTest, EmptyWhitelistSkipsChannelLookup) {
  provider_->SetSegments("vid", {Raw(0, 10, "a")});
  auto resolver = MakeResolver(true);
  EXPECT_FALSE(resolver->WhitelistActive());

  resolver->Resolve("vid");
  EXPECT_EQ(lookup_->calls(), 0);
}

TEST_F(SegmentResolverTest, ChannelLookupFailurePropagates) {
  lookup_->SetFailure(true);
  auto resolver = MakeResolver(true, {"UC_friend"});

  EXPECT_THROW(resolver->Resolve("vid"), std::runtime_error);
  EXPECT_EQ(segment_cache_->Size(), 0u);
  EXPECT_EQ(channel_cache_->Size(), 0u);
}

TEST_F(SegmentResolverTest, UnknownChannelIsALookupError) {
  auto resolver = MakeResolver(true, {"UC_friend"});
  EXPECT_THROW(resolver->Resolve("vid"), SegmentLookupError);
}

TEST_F(SegmentResolverTest, NullCollaboratorsAreRejected) {
  ResolverOptions options;
  EXPECT_THROW(SegmentResolver(nullptr, nullptr, segment_cache_, channel_cache_, options),
               std::invalid_argument);
  EXPECT_THROW(SegmentResolver(provider_, nullptr, nullptr, channel_cache_, options),
               std::invalid_argument);
  EXPECT_THROW(SegmentResolver(provider_, lookup_, segment_cache_, nullptr, options),
               std::invalid_argument);
}

}  // namespace
}  // namespace skiptv::segments
