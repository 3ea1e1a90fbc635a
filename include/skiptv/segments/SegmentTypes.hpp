// Repository: SkipTV
// Component: Segment domain types
// Purpose: Raw provider records, merged skip segments, per-video sets.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_SEGMENTS_SEGMENT_TYPES_HPP_
#define SKIPTV_SEGMENTS_SEGMENT_TYPES_HPP_

#include <string>
#include <vector>

namespace skiptv::segments {

// One record as returned by the segment provider. Unordered, may overlap.
struct RawSegment {
  double start_sec = 0.0;
  double end_sec = 0.0;
  std::string id;
  bool locked = false;
};

// A merged skip interval. ids keeps first-seen order and has no duplicates.
struct Segment {
  double start = 0.0;
  double end = 0.0;
  std::vector<std::string> ids;

  bool operator==(const Segment& other) const {
    return start == other.start && end == other.end && ids == other.ids;
  }
  bool operator!=(const Segment& other) const { return !(*this == other); }
};

// Resolved segments for one video, sorted by start, non-overlapping and at
// least kMergeGapSec apart. permanent: safe to cache without a TTL.
struct SegmentSet {
  std::vector<Segment> segments;
  bool permanent = true;

  bool empty() const { return segments.empty(); }

  bool operator==(const SegmentSet& other) const {
    return permanent == other.permanent && segments == other.segments;
  }
  bool operator!=(const SegmentSet& other) const { return !(*this == other); }
};

// Consecutive segments closer than this are combined.
constexpr double kMergeGapSec = 1.0;

}  // namespace skiptv::segments

#endif  // SKIPTV_SEGMENTS_SEGMENT_TYPES_HPP_
