// Repository: SkipTV
// Component: Channel lookup interface
// Purpose: Maps a video to its owning channel for whitelist checks.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_SEGMENTS_ICHANNEL_LOOKUP_HPP_
#define SKIPTV_SEGMENTS_ICHANNEL_LOOKUP_HPP_

#include <string>

namespace skiptv::segments {

// Throws a std::exception subclass when the video cannot be resolved.
class IChannelLookup {
 public:
  virtual ~IChannelLookup() = default;
  virtual std::string ChannelOf(const std::string& video_id) = 0;
};

}  // namespace skiptv::segments

#endif  // SKIPTV_SEGMENTS_ICHANNEL_LOOKUP_HPP_
