// Repository: SkipTV
// Component: SkipScheduler
// Purpose: Single-flight skip planning and firing.
// Copyright (c) 2026 SkipTV

#include "skiptv/runtime/SkipScheduler.hpp"

#include <chrono>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "skiptv/util/Logger.hpp"

namespace skiptv::runtime {

using skiptv::util::Logger;

std::optional<SkipPlan> PlanSkip(const segments::SegmentSet& set, double position_sec) {
  if (set.segments.empty()) return std::nullopt;

  const segments::Segment& first = set.segments.front();
  if (position_sec < 1.0 && first.end > 1.0 && first.start <= position_sec &&
      position_sec < first.end) {
    SkipPlan plan;
    plan.target_start_sec = position_sec;
    plan.seek_to_sec = first.end;
    plan.ids = first.ids;
    plan.already_active = true;
    return plan;
  }

  for (const auto& segment : set.segments) {
    if (segment.start > position_sec) {
      SkipPlan plan;
      plan.target_start_sec = segment.start;
      plan.seek_to_sec = segment.end;
      plan.ids = segment.ids;
      return plan;
    }
  }
  return std::nullopt;
}

double ComputeDelaySec(const SkipPlan& plan,
                       const PlaybackSample& sample,
                       int64_t now_us,
                       double offset_sec) {
  const double elapsed_sec = static_cast<double>(now_us - sample.observed_at_us) / 1e6;
  return (plan.target_start_sec - sample.position_sec) - elapsed_sec - offset_sec;
}

SkipScheduler::SkipScheduler(Device device,
                             std::shared_ptr<segments::SegmentResolver> resolver,
                             std::shared_ptr<lounge::RemoteController> controller,
                             std::shared_ptr<segments::IViewedReporter> reporter,
                             std::shared_ptr<timing::ITimeSource> time_source,
                             TaskGroup& tasks)
    : device_(std::move(device)),
      resolver_(std::move(resolver)),
      controller_(std::move(controller)),
      reporter_(std::move(reporter)),
      time_source_(std::move(time_source)),
      tasks_(tasks) {
  if (!resolver_ || !controller_ || !time_source_) {
    throw std::invalid_argument("SkipScheduler requires resolver, controller and time source");
  }
}

void SkipScheduler::Schedule(PlaybackSample sample) {
  uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_flag_) {
      pending_flag_->Cancel();
      ++counters_.superseded;
    }
    generation = ++generation_;
    pending_sample_ = sample;
    ++counters_.scheduled;
  }

  // Spawn outside mutex_; the task may start running immediately.
  auto flag = tasks_.Spawn("skip", [this, sample, generation](CancelFlag& cancel) {
    RunSkipTask(sample, generation, cancel);
  });

  std::lock_guard<std::mutex> lock(mutex_);
  if (generation_ != generation || !pending_sample_) {
    // Superseded or already finished before we stored the flag.
    flag->Cancel();
    return;
  }
  if (flag->IsCancelled()) {
    // Task group closed; nothing will run.
    pending_sample_.reset();
    return;
  }
  pending_flag_ = std::move(flag);
}

void SkipScheduler::CancelPending() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!pending_sample_) return;
  if (pending_flag_) pending_flag_->Cancel();
  pending_flag_.reset();
  pending_sample_.reset();
  ++generation_;
  ++counters_.cancelled;
}

bool SkipScheduler::HasPending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_sample_.has_value();
}

std::optional<PlaybackSample> SkipScheduler::PendingSample() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_sample_;
}

SkipScheduler::Counters SkipScheduler::counters() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return counters_;
}

bool SkipScheduler::IsCurrent(uint64_t generation) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_ == generation;
}

bool SkipScheduler::ReleasePending(uint64_t generation) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (generation_ != generation) return false;
  pending_flag_.reset();
  pending_sample_.reset();
  return true;
}

void SkipScheduler::RunSkipTask(const PlaybackSample& sample,
                                uint64_t generation,
                                CancelFlag& cancel) {
  segments::SegmentSet set;
  try {
    set = resolver_->Resolve(sample.video_id);
  } catch (const std::exception& e) {
    if (ReleasePending(generation)) {
      std::lock_guard<std::mutex> lock(mutex_);
      ++counters_.resolve_failed;
    }
    std::ostringstream oss;
    oss << "[SkipScheduler:" << device_.name << "] RESOLVE_FAILED video=" << sample.video_id
        << " error=" << e.what();
    Logger::Warn(oss.str());
    return;
  }

  if (cancel.IsCancelled() || !IsCurrent(generation)) return;

  auto plan = PlanSkip(set, sample.position_sec);
  if (!plan) {
    if (ReleasePending(generation)) {
      std::lock_guard<std::mutex> lock(mutex_);
      ++counters_.no_segment;
    }
    std::ostringstream oss;
    oss << "[SkipScheduler:" << device_.name << "] NO_SEGMENT video=" << sample.video_id
        << " position=" << sample.position_sec;
    Logger::Debug(oss.str());
    return;
  }

  const double delay_sec =
      ComputeDelaySec(*plan, sample, time_source_->NowMonotonicUs(), device_.offset_sec);
  {
    std::ostringstream oss;
    oss << "[SkipScheduler:" << device_.name << "] SKIP_PLANNED video=" << sample.video_id
        << " start=" << plan->target_start_sec << " seek_to=" << plan->seek_to_sec
        << " delay_s=" << delay_sec << (plan->already_active ? " active=true" : "");
    Logger::Info(oss.str());
  }

  if (delay_sec > 0.0) {
    const auto delay = std::chrono::microseconds(static_cast<int64_t>(delay_sec * 1e6));
    if (!cancel.WaitFor(delay)) return;
  }
  if (cancel.IsCancelled() || !ReleasePending(generation)) return;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_.fired;
  }
  {
    std::ostringstream oss;
    oss << "[SkipScheduler:" << device_.name << "] SKIP_FIRED video=" << sample.video_id
        << " seek_to=" << plan->seek_to_sec;
    Logger::Info(oss.str());
  }

  if (!controller_->SeekTo(plan->seek_to_sec)) return;
  ReportViewed(std::move(plan->ids));
}

void SkipScheduler::ReportViewed(std::vector<std::string> ids) {
  if (!reporter_ || ids.empty()) return;
  auto reporter = reporter_;
  const std::string device_name = device_.name;
  tasks_.Spawn("report-viewed", [reporter, device_name, ids = std::move(ids)](CancelFlag&) {
    try {
      reporter->Report(ids);
    } catch (const std::exception& e) {
      std::ostringstream oss;
      oss << "[SkipScheduler:" << device_name << "] REPORT_FAILED count=" << ids.size()
          << " error=" << e.what();
      Logger::Warn(oss.str());
    }
  });
}

}  // namespace skiptv::runtime
