// Repository: SkipTV
// Component: SkipScheduler
// Purpose: Turns a playback sample into at most one pending skip per device:
//          resolve segments, pick the next one, sleep until due, seek past it.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_RUNTIME_SKIP_SCHEDULER_HPP_
#define SKIPTV_RUNTIME_SKIP_SCHEDULER_HPP_

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "skiptv/lounge/RemoteController.hpp"
#include "skiptv/runtime/CancelFlag.hpp"
#include "skiptv/runtime/Device.hpp"
#include "skiptv/runtime/TaskGroup.hpp"
#include "skiptv/segments/IViewedReporter.hpp"
#include "skiptv/segments/SegmentResolver.hpp"
#include "skiptv/timing/ITimeSource.hpp"

namespace skiptv::runtime {

struct PlaybackSample {
  std::string video_id;
  double position_sec = 0.0;
  int64_t observed_at_us = 0;  // ITimeSource clock
};

struct SkipPlan {
  double target_start_sec = 0.0;
  double seek_to_sec = 0.0;
  std::vector<std::string> ids;
  bool already_active = false;  // position sits inside the opening segment
};

// Picks the segment to skip for a position. Only the first segment (start
// order) is checked for the opening-second rule.
std::optional<SkipPlan> PlanSkip(const segments::SegmentSet& set, double position_sec);

// Seconds until the skip should fire; <= 0 means now.
double ComputeDelaySec(const SkipPlan& plan,
                       const PlaybackSample& sample,
                       int64_t now_us,
                       double offset_sec);

class SkipScheduler {
 public:
  struct Counters {
    uint64_t scheduled = 0;
    uint64_t superseded = 0;  // cancelled by a newer sample
    uint64_t cancelled = 0;   // cancelled without replacement
    uint64_t fired = 0;
    uint64_t no_segment = 0;
    uint64_t resolve_failed = 0;
  };

  // reporter may be null: viewed reporting is then disabled.
  SkipScheduler(Device device,
                std::shared_ptr<segments::SegmentResolver> resolver,
                std::shared_ptr<lounge::RemoteController> controller,
                std::shared_ptr<segments::IViewedReporter> reporter,
                std::shared_ptr<timing::ITimeSource> time_source,
                TaskGroup& tasks);

  SkipScheduler(const SkipScheduler&) = delete;
  SkipScheduler& operator=(const SkipScheduler&) = delete;

  // Replaces any pending skip with one derived from `sample`.
  void Schedule(PlaybackSample sample);

  // Cancels the pending skip, if any.
  void CancelPending();

  bool HasPending() const;
  std::optional<PlaybackSample> PendingSample() const;

  Counters counters() const;

 private:
  void RunSkipTask(const PlaybackSample& sample, uint64_t generation, CancelFlag& cancel);
  bool IsCurrent(uint64_t generation) const;
  // Clears the pending slot if it still belongs to `generation`.
  bool ReleasePending(uint64_t generation);
  void ReportViewed(std::vector<std::string> ids);

  const Device device_;
  std::shared_ptr<segments::SegmentResolver> resolver_;
  std::shared_ptr<lounge::RemoteController> controller_;
  std::shared_ptr<segments::IViewedReporter> reporter_;
  std::shared_ptr<timing::ITimeSource> time_source_;
  TaskGroup& tasks_;

  mutable std::mutex mutex_;
  uint64_t generation_ = 0;                       // Guarded by mutex_
  std::shared_ptr<CancelFlag> pending_flag_;      // Guarded by mutex_
  std::optional<PlaybackSample> pending_sample_;  // Guarded by mutex_
  Counters counters_;                             // Guarded by mutex_
};

}  // namespace skiptv::runtime

#endif  // SKIPTV_RUNTIME_SKIP_SCHEDULER_HPP_
