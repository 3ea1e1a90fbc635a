// Repository: SkipTV
// Component: Segment Merge Engine
// Purpose: Convert raw, overlapping provider intervals into the canonical
//          minimal SegmentSet used by the skip scheduler.
// Copyright (c) 2026 SkipTV

#include "skiptv/segments/SegmentMerge.hpp"

#include <algorithm>

namespace skiptv::segments {

namespace {

void AppendUnique(std::vector<std::string>& ids, const std::string& id) {
  if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
    ids.push_back(id);
  }
}

}  // namespace

SegmentSet MergeSegments(std::vector<RawSegment> raw) {
  SegmentSet result;
  result.permanent = true;
  if (raw.empty()) {
    return result;
  }

  for (const auto& r : raw) {
    result.permanent = result.permanent && r.locked;
  }

  std::stable_sort(raw.begin(), raw.end(), [](const RawSegment& a, const RawSegment& b) {
    return a.end_sec < b.end_sec;
  });

  // Extend ends: i absorbs the end of any j that starts inside i and ends later.
  for (size_t i = 0; i < raw.size(); ++i) {
    for (size_t j = 0; j < raw.size(); ++j) {
      if (raw[j].start_sec <= raw[i].end_sec && raw[i].end_sec <= raw[j].end_sec) {
        raw[i].end_sec = raw[j].end_sec;
      }
    }
  }

  std::stable_sort(raw.begin(), raw.end(), [](const RawSegment& a, const RawSegment& b) {
    return a.start_sec < b.start_sec;
  });

  // Extend starts: i takes the start of any j whose range contains i's start.
  for (size_t i = raw.size(); i-- > 0;) {
    for (size_t j = raw.size(); j-- > 0;) {
      if (raw[j].start_sec <= raw[i].start_sec && raw[i].start_sec <= raw[j].end_sec) {
        raw[i].start_sec = raw[j].start_sec;
      }
    }
  }

  // Keep start order after the start sweep.
  std::stable_sort(raw.begin(), raw.end(), [](const RawSegment& a, const RawSegment& b) {
    return a.start_sec < b.start_sec;
  });

  for (const auto& r : raw) {
    if (!result.segments.empty()) {
      Segment& last = result.segments.back();
      if (r.start_sec - last.end < kMergeGapSec) {
        last.start = std::min(last.start, r.start_sec);
        last.end = std::max(last.end, r.end_sec);
        AppendUnique(last.ids, r.id);
        continue;
      }
    }
    Segment seg;
    seg.start = r.start_sec;
    seg.end = r.end_sec;
    seg.ids.push_back(r.id);
    result.segments.push_back(std::move(seg));
  }

  return result;
}

std::vector<RawSegment> Flatten(const SegmentSet& set) {
  std::vector<RawSegment> raw;
  for (const auto& seg : set.segments) {
    for (const auto& id : seg.ids) {
      RawSegment r;
      r.start_sec = seg.start;
      r.end_sec = seg.end;
      r.id = id;
      r.locked = set.permanent;
      raw.push_back(std::move(r));
    }
  }
  return raw;
}

}  // namespace skiptv::segments
