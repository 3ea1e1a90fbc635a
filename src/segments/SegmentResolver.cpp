// Repository: SkipTV
// Component: Segment Resolver
// Purpose: Single lookup path from video id to cached, merged SegmentSet.
// Copyright (c) 2026 SkipTV

#include "skiptv/segments/SegmentResolver.hpp"

#include <algorithm>
#include <sstream>

#include "skiptv/segments/SegmentMerge.hpp"
#include "skiptv/util/Logger.hpp"

namespace skiptv::segments {

using util::Logger;

SegmentResolver::SegmentResolver(std::shared_ptr<ISegmentProvider> provider,
                                 std::shared_ptr<IChannelLookup> channel_lookup,
                                 std::shared_ptr<SegmentCache> segment_cache,
                                 std::shared_ptr<ChannelCache> channel_cache,
                                 ResolverOptions options)
    : provider_(std::move(provider)),
      channel_lookup_(std::move(channel_lookup)),
      segment_cache_(std::move(segment_cache)),
      channel_cache_(std::move(channel_cache)),
      options_(std::move(options)) {
  if (!provider_) {
    throw std::invalid_argument("SegmentResolver requires a segment provider");
  }
  if (!segment_cache_) {
    throw std::invalid_argument("SegmentResolver requires a segment cache");
  }
  if (channel_lookup_ && !channel_cache_) {
    throw std::invalid_argument("SegmentResolver requires a channel cache with a channel lookup");
  }
}

SegmentSet SegmentResolver::Resolve(const std::string& video_id) {
  if (video_id.empty()) {
    throw SegmentLookupError("empty video id");
  }

  if (auto cached = segment_cache_->Get(video_id)) {
    Logger::Debug("[SegmentResolver] CACHE_HIT video=" + video_id);
    return *cached;
  }

  if (IsWhitelisted(video_id)) {
    Logger::Info("[SegmentResolver] WHITELISTED video=" + video_id);
    SegmentSet empty;
    empty.permanent = true;
    segment_cache_->Set(video_id, empty, true);
    return empty;
  }

  std::vector<RawSegment> raw = provider_->FetchSegments(video_id, options_.categories);
  const size_t raw_count = raw.size();
  SegmentSet merged = MergeSegments(std::move(raw));

  {
    std::ostringstream oss;
    oss << "[SegmentResolver] FETCHED video=" << video_id
        << " raw=" << raw_count
        << " merged=" << merged.segments.size()
        << " permanent=" << (merged.permanent ? "Y" : "N");
    Logger::Info(oss.str());
  }

  segment_cache_->Set(video_id, merged, merged.permanent);
  return merged;
}

bool SegmentResolver::IsWhitelisted(const std::string& video_id) {
  if (!WhitelistActive()) {
    return false;
  }
  const std::string channel_id = ChannelOf(video_id);
  const auto& wl = options_.channel_whitelist;
  return std::find(wl.begin(), wl.end(), channel_id) != wl.end();
}

std::string SegmentResolver::ChannelOf(const std::string& video_id) {
  if (auto cached = channel_cache_->Get(video_id)) {
    return *cached;
  }
  std::string channel_id = channel_lookup_->ChannelOf(video_id);
  if (channel_id.empty()) {
    throw SegmentLookupError("no channel for video " + video_id);
  }
  channel_cache_->Set(video_id, channel_id, false);
  return channel_id;
}

}  // namespace skiptv::segments
