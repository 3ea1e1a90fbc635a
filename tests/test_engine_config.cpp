// Repository: SkipTV
// Component: EngineConfig unit tests

#include <gtest/gtest.h>

#include <string>

#include "skiptv/config/EngineConfig.hpp"

namespace skiptv::config {
namespace {

const char* kFullConfig = R"({
  "apikey": "key-123",
  "skip_categories": ["sponsor", "selfpromo", "intro"],
  "channel_whitelist": [{"id": "UC-one", "name": "One"}, {"id": "UC-two", "name": "Two"}],
  "skip_count_tracking": false,
  "mute_ads": true,
  "skip_ads": true,
  "auto_play": false,
  "debug": true,
  "devices": [
    {"screen_id": "screen-1", "name": "Living Room", "offset": 0.25},
    {"screen_id": "screen-2"}
  ],
  "watchdog_window_ms": 20000,
  "reconnect_backoff_ms": 5000,
  "segment_cache_capacity": 32
})";

TEST(EngineConfigTest, ParsesEveryField) {
  auto config = EngineConfig::FromJson(kFullConfig);
  ASSERT_TRUE(config.has_value());

  ASSERT_EQ(config->devices.size(), 2u);
  EXPECT_EQ(config->devices[0].screen_id, "screen-1");
  EXPECT_EQ(config->devices[0].name, "Living Room");
  EXPECT_DOUBLE_EQ(config->devices[0].offset_sec, 0.25);

  EXPECT_EQ(config->skip_categories,
            (std::vector<std::string>{"sponsor", "selfpromo", "intro"}));
  EXPECT_EQ(config->channel_whitelist, (std::vector<std::string>{"UC-one", "UC-two"}));
  EXPECT_EQ(config->api_key, "key-123");
  EXPECT_FALSE(config->skip_count_tracking);
  EXPECT_TRUE(config->mute_ads);
  EXPECT_TRUE(config->skip_ads);
  EXPECT_FALSE(config->auto_play);
  EXPECT_TRUE(config->debug);
  EXPECT_EQ(config->watchdog_window_ms, 20000);
  EXPECT_EQ(config->reconnect_backoff_ms, 5000);
  EXPECT_EQ(config->segment_cache_capacity, 32);
  EXPECT_TRUE(config->Validate().empty());
  EXPECT_TRUE(config->WhitelistEnabled());
}

TEST(EngineConfigTest, DeviceNameDefaultsToScreenId) {
  auto config = EngineConfig::FromJson(kFullConfig);
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->devices[1].name, "screen-2");
  EXPECT_DOUBLE_EQ(config->devices[1].offset_sec, 0.0);
}

TEST(EngineConfigTest, MinimalConfigUsesDefaults) {
  auto config = EngineConfig::FromJson(R"({"devices": [{"screen_id": "s"}]})");
  ASSERT_TRUE(config.has_value());

  EXPECT_EQ(config->skip_categories, std::vector<std::string>{"sponsor"});
  EXPECT_TRUE(config->skip_count_tracking);
  EXPECT_FALSE(config->mute_ads);
  EXPECT_FALSE(config->skip_ads);
  EXPECT_TRUE(config->auto_play);
  EXPECT_EQ(config->watchdog_window_ms, 35000);
  EXPECT_EQ(config->reconnect_backoff_ms, 10000);
  EXPECT_EQ(config->segment_cache_ttl_s, 300);
  EXPECT_EQ(config->segment_cache_capacity, 10);
  EXPECT_EQ(config->channel_cache_ttl_s, 3600);
  EXPECT_EQ(config->channel_cache_capacity, 100);
  EXPECT_FALSE(config->WhitelistEnabled());
}

TEST(EngineConfigTest, RejectsUnusableText) {
  EXPECT_FALSE(EngineConfig::FromJson("").has_value());
  EXPECT_FALSE(EngineConfig::FromJson("[1, 2]").has_value());
  EXPECT_FALSE(EngineConfig::FromJson(R"({"apikey": "k"})").has_value());
  EXPECT_FALSE(EngineConfig::FromJson(R"({"devices": []})").has_value());
  EXPECT_FALSE(EngineConfig::FromJson(R"({"devices": [{"name": "no screen"}]})").has_value());
}

TEST(EngineConfigTest, WhitelistNeedsApiKey) {
  auto config = EngineConfig::FromJson(
      R"({"devices": [{"screen_id": "s"}], "channel_whitelist": [{"id": "UC-one"}]})");
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->channel_whitelist.size(), 1u);
  EXPECT_FALSE(config->WhitelistEnabled());
}

TEST(EngineConfigTest, ValidateReportsEachProblem) {
  EngineConfig config;
  config.devices = {{"a", "screen-1", 0.0}, {"b", "screen-1", 0.0}, {"c", "", 0.0}};
  config.skip_categories.clear();
  config.watchdog_window_ms = 0;
  config.reconnect_backoff_ms = -1;

  auto problems = config.Validate();
  ASSERT_EQ(problems.size(), 5u);
  EXPECT_NE(problems[0].find("duplicate screen_id"), std::string::npos);
  EXPECT_NE(problems[1].find("no screen_id"), std::string::npos);
  EXPECT_NE(problems[2].find("skip_categories"), std::string::npos);
  EXPECT_NE(problems[3].find("watchdog_window_ms"), std::string::npos);
  EXPECT_NE(problems[4].find("reconnect_backoff_ms"), std::string::npos);
}

TEST(EngineConfigTest, EmptyDeviceListIsInvalid) {
  EngineConfig config;
  auto problems = config.Validate();
  ASSERT_EQ(problems.size(), 1u);
  EXPECT_EQ(problems[0], "no devices configured");
}

TEST(EngineConfigTest, SessionPolicyCarriesKnobs) {
  auto config = EngineConfig::FromJson(kFullConfig);
  ASSERT_TRUE(config.has_value());

  runtime::SessionPolicy policy = config->ToSessionPolicy();
  EXPECT_TRUE(policy.mute_ads);
  EXPECT_TRUE(policy.skip_ads);
  EXPECT_FALSE(policy.auto_play);
  EXPECT_FALSE(policy.skip_count_tracking);
  EXPECT_EQ(policy.watchdog_window, std::chrono::milliseconds(20000));
  EXPECT_EQ(policy.reconnect_backoff, std::chrono::milliseconds(5000));

  segments::ResolverOptions options = config->ToResolverOptions();
  EXPECT_EQ(options.categories.size(), 3u);
  EXPECT_EQ(options.channel_whitelist.size(), 2u);
}

}  // namespace
}  // namespace skiptv::config
