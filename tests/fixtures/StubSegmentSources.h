// Repository: SkipTV
// Component: Segment collaborator stubs
// Purpose: Scriptable segment provider, channel lookup and viewed reporter.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_TESTS_FIXTURES_STUB_SEGMENT_SOURCES_H_
#define SKIPTV_TESTS_FIXTURES_STUB_SEGMENT_SOURCES_H_

#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "skiptv/segments/IChannelLookup.hpp"
#include "skiptv/segments/ISegmentProvider.hpp"
#include "skiptv/segments/IViewedReporter.hpp"

namespace skiptv::tests::fixtures {

class StubSegmentProvider : public segments::ISegmentProvider {
 public:
  void SetSegments(const std::string& video_id, std::vector<segments::RawSegment> raw) {
    std::lock_guard<std::mutex> lock(mutex_);
    segments_[video_id] = std::move(raw);
  }

  void SetFailure(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_ = fail;
  }

  void SetLatency(std::chrono::milliseconds latency) {
    std::lock_guard<std::mutex> lock(mutex_);
    latency_ = latency;
  }

  std::vector<segments::RawSegment> FetchSegments(
      const std::string& video_id, const std::vector<std::string>& categories) override {
    std::chrono::milliseconds latency{0};
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++calls_;
      last_categories_ = categories;
      latency = latency_;
      if (fail_) throw std::runtime_error("provider unavailable");
    }
    if (latency.count() > 0) std::this_thread::sleep_for(latency);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = segments_.find(video_id);
    if (it == segments_.end()) return {};
    return it->second;
  }

  int calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  std::vector<std::string> last_categories() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_categories_;
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::vector<segments::RawSegment>> segments_;
  std::vector<std::string> last_categories_;
  std::chrono::milliseconds latency_{0};
  bool fail_ = false;
  int calls_ = 0;
};

class StubChannelLookup : public segments::IChannelLookup {
 public:
  void SetChannel(const std::string& video_id, const std::string& channel_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    channels_[video_id] = channel_id;
  }

  void SetFailure(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_ = fail;
  }

  std::string ChannelOf(const std::string& video_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_;
    if (fail_) throw std::runtime_error("lookup unavailable");
    auto it = channels_.find(video_id);
    return it == channels_.end() ? std::string() : it->second;
  }

  int calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> channels_;
  bool fail_ = false;
  int calls_ = 0;
};

class RecordingViewedReporter : public segments::IViewedReporter {
 public:
  void Report(const std::vector<std::string>& segment_ids) override {
    std::lock_guard<std::mutex> lock(mutex_);
    reports_.push_back(segment_ids);
    if (fail_) throw std::runtime_error("report rejected");
  }

  void SetFailure(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_ = fail;
  }

  std::vector<std::vector<std::string>> reports() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reports_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::vector<std::string>> reports_;
  bool fail_ = false;
};

}  // namespace skiptv::tests::fixtures

#endif  // SKIPTV_TESTS_FIXTURES_STUB_SEGMENT_SOURCES_H_
