// Repository: SkipTV
// Component: Viewed-segment reporter interface
// Purpose: Best-effort skip-count tracking for fired segments.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_SEGMENTS_IVIEWED_REPORTER_HPP_
#define SKIPTV_SEGMENTS_IVIEWED_REPORTER_HPP_

#include <string>
#include <vector>

namespace skiptv::segments {

class IViewedReporter {
 public:
  virtual ~IViewedReporter() = default;
  // May throw; callers log and continue.
  virtual void Report(const std::vector<std::string>& segment_ids) = 0;
};

}  // namespace skiptv::segments

#endif  // SKIPTV_SEGMENTS_IVIEWED_REPORTER_HPP_
