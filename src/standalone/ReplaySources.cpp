// Repository: SkipTV
// Component: Replay collaborators
// Purpose: File-backed collaborators for the replay harness.
// Copyright (c) 2026 SkipTV

#include "ReplaySources.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "skiptv/util/JsonScan.hpp"
#include "skiptv/util/Logger.hpp"

namespace skiptv::standalone {

using skiptv::util::Logger;
namespace json = skiptv::util::json;

std::optional<SegmentLine> ParseSegmentLine(const std::string& line) {
  SegmentLine parsed;
  if (!json::ExtractString(line, "video_id", &parsed.video_id) || parsed.video_id.empty()) {
    return std::nullopt;
  }
  if (!json::ExtractDouble(line, "start", &parsed.segment.start_sec) ||
      !json::ExtractDouble(line, "end", &parsed.segment.end_sec)) {
    return std::nullopt;
  }
  if (parsed.segment.end_sec < parsed.segment.start_sec) return std::nullopt;
  if (!json::ExtractString(line, "uuid", &parsed.segment.id) || parsed.segment.id.empty()) {
    return std::nullopt;
  }
  json::ExtractBool(line, "locked", &parsed.segment.locked);
  json::ExtractString(line, "category", &parsed.category);
  return parsed;
}

FileSegmentProvider::FileSegmentProvider(std::vector<SegmentLine> lines) {
  for (auto& line : lines) {
    std::string video_id = line.video_id;
    by_video_[video_id].push_back(std::move(line));
  }
}

std::vector<segments::RawSegment> FileSegmentProvider::FetchSegments(
    const std::string& video_id, const std::vector<std::string>& categories) {
  fetch_count_.fetch_add(1);

  std::vector<segments::RawSegment> out;
  auto it = by_video_.find(video_id);
  if (it == by_video_.end()) return out;

  for (const auto& line : it->second) {
    const bool wanted =
        line.category.empty() || categories.empty() ||
        std::find(categories.begin(), categories.end(), line.category) != categories.end();
    if (wanted) out.push_back(line.segment);
  }
  return out;
}

FileChannelLookup::FileChannelLookup(std::map<std::string, std::string> channels)
    : channels_(std::move(channels)) {}

std::string FileChannelLookup::ChannelOf(const std::string& video_id) {
  auto it = channels_.find(video_id);
  if (it == channels_.end()) {
    throw std::runtime_error("no channel known for video " + video_id);
  }
  return it->second;
}

std::optional<std::pair<std::string, std::string>> ParseChannelLine(const std::string& line) {
  std::string video_id;
  std::string channel_id;
  if (!json::ExtractString(line, "video_id", &video_id) || video_id.empty()) return std::nullopt;
  if (!json::ExtractString(line, "channel_id", &channel_id) || channel_id.empty()) {
    return std::nullopt;
  }
  return std::make_pair(video_id, channel_id);
}

void LoggingViewedReporter::Report(const std::vector<std::string>& segment_ids) {
  reported_.fetch_add(segment_ids.size());
  std::ostringstream oss;
  oss << "[ViewedReporter] VIEWED count=" << segment_ids.size() << " ids=";
  for (size_t i = 0; i < segment_ids.size(); ++i) {
    if (i > 0) oss << ",";
    oss << segment_ids[i];
  }
  Logger::Info(oss.str());
}

}  // namespace skiptv::standalone
