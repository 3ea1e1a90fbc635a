// Repository: SkipTV
// Component: Replay collaborators
// Purpose: File-backed segment provider and channel lookup plus a logging
//          viewed reporter, used by the replay harness.
// Copyright (c) 2026 SkipTV

#ifndef SKIPTV_STANDALONE_REPLAY_SOURCES_HPP_
#define SKIPTV_STANDALONE_REPLAY_SOURCES_HPP_

#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <string>
#include <vector>

#include "skiptv/segments/IChannelLookup.hpp"
#include "skiptv/segments/ISegmentProvider.hpp"
#include "skiptv/segments/IViewedReporter.hpp"

namespace skiptv::standalone {

// One line of the segments file:
//   {"video_id": "abc", "start": 5.0, "end": 8.0, "uuid": "s1",
//    "locked": true, "category": "sponsor"}
struct SegmentLine {
  std::string video_id;
  std::string category;
  segments::RawSegment segment;
};

std::optional<SegmentLine> ParseSegmentLine(const std::string& line);

class FileSegmentProvider : public segments::ISegmentProvider {
 public:
  explicit FileSegmentProvider(std::vector<SegmentLine> lines);

  // Unknown videos have no segments. Lines without a category match every
  // requested category.
  std::vector<segments::RawSegment> FetchSegments(
      const std::string& video_id, const std::vector<std::string>& categories) override;

  uint64_t fetch_count() const { return fetch_count_.load(); }

 private:
  std::map<std::string, std::vector<SegmentLine>> by_video_;
  std::atomic<uint64_t> fetch_count_{0};
};

// One line of the channels file: {"video_id": "abc", "channel_id": "UC..."}
class FileChannelLookup : public segments::IChannelLookup {
 public:
  explicit FileChannelLookup(std::map<std::string, std::string> channels);

  // Throws std::runtime_error for videos missing from the file.
  std::string ChannelOf(const std::string& video_id) override;

 private:
  std::map<std::string, std::string> channels_;
};

std::optional<std::pair<std::string, std::string>> ParseChannelLine(const std::string& line);

class LoggingViewedReporter : public segments::IViewedReporter {
 public:
  void Report(const std::vector<std::string>& segment_ids) override;

  uint64_t reported() const { return reported_.load(); }

 private:
  std::atomic<uint64_t> reported_{0};
};

}  // namespace skiptv::standalone

#endif  // SKIPTV_STANDALONE_REPLAY_SOURCES_HPP_
