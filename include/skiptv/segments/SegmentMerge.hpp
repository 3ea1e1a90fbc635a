// Repository: SkipTV
// Component: Segment Merge Engine
// Purpose: Convert raw, overlapping provider intervals into the canonical
//          minimal SegmentSet used by the skip scheduler.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_SEGMENTS_SEGMENT_MERGE_HPP_
#define SKIPTV_SEGMENTS_SEGMENT_MERGE_HPP_

#include <vector>

#include "skiptv/segments/SegmentTypes.hpp"

namespace skiptv::segments {

// Deterministic merge:
//   1. stable sort by end
//   2. end-extension sweep over every pair
//   3. stable sort by start
//   4. start-extension sweep over every pair (back to front)
//   5. combine neighbours closer than kMergeGapSec, ids concatenated in order
//   6. permanent = all inputs locked (true for empty input)
//
// Both sweeps are needed: partial overlaps can run in either direction and a
// single sort-and-merge misses chains that only appear after one extension.
SegmentSet MergeSegments(std::vector<RawSegment> raw);

// One raw record per id, carrying the merged bounds. locked mirrors
// set.permanent so MergeSegments(Flatten(s)) == s.
std::vector<RawSegment> Flatten(const SegmentSet& set);

}  // namespace skiptv::segments

#endif  // SKIPTV_SEGMENTS_SEGMENT_MERGE_HPP_
