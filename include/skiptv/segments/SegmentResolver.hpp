// Repository: SkipTV
// Component: Segment Resolver
// Purpose: Single lookup path from video id to cached, merged SegmentSet:
//          segment cache → channel whitelist → provider → merge → cache.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_SEGMENTS_SEGMENT_RESOLVER_HPP_
#define SKIPTV_SEGMENTS_SEGMENT_RESOLVER_HPP_

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "skiptv/cache/TtlLruCache.hpp"
#include "skiptv/segments/IChannelLookup.hpp"
#include "skiptv/segments/ISegmentProvider.hpp"
#include "skiptv/segments/SegmentTypes.hpp"

namespace skiptv::segments {

using SegmentCache = cache::TtlLruCache<SegmentSet>;
using ChannelCache = cache::TtlLruCache<std::string>;

class SegmentLookupError : public std::runtime_error {
 public:
  explicit SegmentLookupError(const std::string& what) : std::runtime_error(what) {}
};

struct ResolverOptions {
  std::vector<std::string> categories;
  // Channel ids exempt from skipping. Only consulted when a channel lookup
  // collaborator is supplied.
  std::vector<std::string> channel_whitelist;
};

// Thread-safe: every device session shares one resolver. Collaborator
// failures propagate to the caller and leave both caches untouched.
class SegmentResolver {
 public:
  SegmentResolver(std::shared_ptr<ISegmentProvider> provider,
                  std::shared_ptr<IChannelLookup> channel_lookup,
                  std::shared_ptr<SegmentCache> segment_cache,
                  std::shared_ptr<ChannelCache> channel_cache,
                  ResolverOptions options);

  SegmentResolver(const SegmentResolver&) = delete;
  SegmentResolver& operator=(const SegmentResolver&) = delete;

  SegmentSet Resolve(const std::string& video_id);

  bool IsWhitelisted(const std::string& video_id);

  bool WhitelistActive() const {
    return channel_lookup_ != nullptr && !options_.channel_whitelist.empty();
  }

 private:
  std::string ChannelOf(const std::string& video_id);

  std::shared_ptr<ISegmentProvider> provider_;
  std::shared_ptr<IChannelLookup> channel_lookup_;
  std::shared_ptr<SegmentCache> segment_cache_;
  std::shared_ptr<ChannelCache> channel_cache_;
  ResolverOptions options_;
};

}  // namespace skiptv::segments

#endif  // SKIPTV_SEGMENTS_SEGMENT_RESOLVER_HPP_
