// Repository: SkipTV
// Component: Segment provider interface
// Purpose: Narrow contract over the external segment database.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_SEGMENTS_ISEGMENT_PROVIDER_HPP_
#define SKIPTV_SEGMENTS_ISEGMENT_PROVIDER_HPP_

#include <string>
#include <vector>

#include "skiptv/segments/SegmentTypes.hpp"

namespace skiptv::segments {

// Returns every raw skip record for video_id restricted to `categories`.
// An unknown video yields an empty list. Transport or decode failures are
// reported by throwing a std::exception subclass.
class ISegmentProvider {
 public:
  virtual ~ISegmentProvider() = default;

  virtual std::vector<RawSegment> FetchSegments(
      const std::string& video_id,
      const std::vector<std::string>& categories) = 0;
};

}  // namespace skiptv::segments

#endif  // SKIPTV_SEGMENTS_ISEGMENT_PROVIDER_HPP_
