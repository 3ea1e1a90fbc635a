// Repository: SkipTV
// Component: Lounge event decoding unit tests

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "skiptv/lounge/LoungeEvent.hpp"

namespace skiptv::lounge {
namespace {

RawEvent Make(const std::string& name, EventPayload payload = {}) {
  RawEvent e;
  e.name = name;
  e.payload = std::move(payload);
  return e;
}

template <typename T>
T As(const DecodeResult& result) {
  EXPECT_EQ(result.status, DecodeStatus::kDecoded) << result.error;
  if (!result.event || !std::holds_alternative<T>(*result.event)) {
    ADD_FAILURE() << "unexpected event type";
    return T{};
  }
  return std::get<T>(*result.event);
}

TEST(LoungeEventTest, StateChangeWithPosition) {
  auto result = DecodeEvent(Make("onStateChange", {{"state", "1"}, {"currentTime", "12.5"}}));
  const auto& e = As<StateChanged>(result);
  EXPECT_EQ(e.state, PlayerState::kPlaying);
  ASSERT_TRUE(e.current_time.has_value());
  EXPECT_DOUBLE_EQ(*e.current_time, 12.5);
  EXPECT_FALSE(e.video_id.has_value());
  EXPECT_STREQ(EventName(*result.event), "onStateChange");
}

TEST(LoungeEventTest, StateChangeWithoutStateIsMalformed) {
  EXPECT_EQ(DecodeEvent(Make("onStateChange", {{"currentTime", "3"}})).status,
            DecodeStatus::kMalformed);
  EXPECT_EQ(DecodeEvent(Make("onStateChange", {{"state", "playing"}})).status,
            DecodeStatus::kMalformed);
  EXPECT_EQ(DecodeEvent(Make("onStateChange", {{"state", "1"}, {"currentTime", "abc"}})).status,
            DecodeStatus::kMalformed);
}

TEST(LoungeEventTest, NowPlayingMayBeEmpty) {
  auto result = DecodeEvent(Make("nowPlaying"));
  const auto& e = As<NowPlaying>(result);
  EXPECT_FALSE(e.video_id.has_value());
  EXPECT_FALSE(e.state.has_value());

  auto full = DecodeEvent(
      Make("nowPlaying", {{"videoId", "abc"}, {"state", "2"}, {"currentTime", "4"}}));
  const auto& f = As<NowPlaying>(full);
  EXPECT_EQ(f.video_id.value_or(""), "abc");
  EXPECT_TRUE(f.state == PlayerState::kPaused);
}

TEST(LoungeEventTest, AdStateChange) {
  const auto& started = As<AdStateChanged>(
      DecodeEvent(Make("onAdStateChange", {{"adState", "1"}, {"isSkipEnabled", "true"}})));
  EXPECT_TRUE(started.active);
  EXPECT_TRUE(started.skip_enabled);

  const auto& ended = As<AdStateChanged>(DecodeEvent(Make("onAdStateChange", {{"adState", "0"}})));
  EXPECT_FALSE(ended.active);
  EXPECT_FALSE(ended.skip_enabled);

  EXPECT_EQ(DecodeEvent(Make("onAdStateChange")).status, DecodeStatus::kMalformed);
}

TEST(LoungeEventTest, AdPlayingCarriesContentVideo) {
  const auto& e = As<AdPlaying>(
      DecodeEvent(Make("adPlaying", {{"contentVideoId", "main"}, {"isSkipEnabled", "false"}})));
  EXPECT_EQ(e.content_video_id.value_or(""), "main");
  EXPECT_FALSE(e.skip_enabled);
}

TEST(LoungeEventTest, VolumeChangedRequiresBothFields) {
  const auto& e =
      As<VolumeChanged>(DecodeEvent(Make("onVolumeChanged", {{"volume", "35"}, {"muted", "true"}})));
  EXPECT_EQ(e.volume, 35);
  EXPECT_TRUE(e.muted);

  EXPECT_EQ(DecodeEvent(Make("onVolumeChanged", {{"volume", "35"}})).status,
            DecodeStatus::kMalformed);
}

TEST(LoungeEventTest, LoungeStatusParsesNestedDeviceInfo) {
  const std::string devices =
      R"([{"app":"lb-v4","type":"LOUNGE_SCREEN","deviceInfo":"{\"clientName\":\"TVHTML5_FOR_KIDS\"}"},)"
      R"({"type":"REMOTE_CONTROL","deviceInfo":"{\"clientName\":\"ANDROID\"}"}])";
  const auto& e = As<LoungeStatus>(DecodeEvent(Make("loungeStatus", {{"devices", devices}})));
  ASSERT_EQ(e.devices.size(), 2u);
  EXPECT_EQ(e.devices[0].type, "LOUNGE_SCREEN");
  EXPECT_EQ(e.devices[0].client_name, "TVHTML5_FOR_KIDS");
  EXPECT_EQ(e.devices[1].type, "REMOTE_CONTROL");
  EXPECT_EQ(e.devices[1].client_name, "ANDROID");
}

TEST(LoungeEventTest, LoungeStatusWithoutDeviceArrayIsMalformed) {
  EXPECT_EQ(DecodeEvent(Make("loungeStatus")).status, DecodeStatus::kMalformed);
  EXPECT_EQ(DecodeEvent(Make("loungeStatus", {{"devices", "nope"}})).status,
            DecodeStatus::kMalformed);
}

TEST(LoungeEventTest, AutoplayModeChanged) {
  EXPECT_TRUE(As<AutoplayModeChanged>(
                  DecodeEvent(Make("onAutoplayModeChanged", {{"autoplayMode", "ENABLED"}})))
                  .enabled.value_or(false));
  EXPECT_FALSE(
      As<AutoplayModeChanged>(DecodeEvent(Make("onAutoplayModeChanged"))).enabled.has_value());
}

TEST(LoungeEventTest, PlaybackSpeedAcceptsEitherFieldName) {
  EXPECT_DOUBLE_EQ(As<PlaybackSpeedChanged>(DecodeEvent(
                       Make("onPlaybackSpeedChanged", {{"playbackSpeed", "1.5"}})))
                       .speed,
                   1.5);
  EXPECT_DOUBLE_EQ(As<PlaybackSpeedChanged>(DecodeEvent(
                       Make("onPlaybackSpeedChanged", {{"playbackRate", "2"}})))
                       .speed,
                   2.0);
  EXPECT_EQ(DecodeEvent(Make("onPlaybackSpeedChanged")).status, DecodeStatus::kMalformed);
}

TEST(LoungeEventTest, ShortsEvents) {
  EXPECT_EQ(As<ScreenDisconnected>(DecodeEvent(Make(
                "loungeScreenDisconnected", {{"reason", "disconnectedByUserScreenInitiated"}})))
                .reason,
            "disconnectedByUserScreenInitiated");
  EXPECT_EQ(As<SubtitlesTrackChanged>(
                DecodeEvent(Make("onSubtitlesTrackChanged", {{"videoId", "v1"}})))
                .video_id.value_or(""),
            "v1");
}

TEST(LoungeEventTest, UnknownNameIsNotMalformed) {
  auto result = DecodeEvent(Make("onHasPreviousNextChanged", {{"x", "y"}}));
  EXPECT_EQ(result.status, DecodeStatus::kUnknown);
  EXPECT_FALSE(result.event.has_value());
}

}  // namespace
}  // namespace skiptv::lounge
