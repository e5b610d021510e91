#include "StegoConfig.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace lsbkit;

TEST(ConfigTest, Defaults) {
  const StegoConfig config;
  EXPECT_EQ(config.bitsPerPixel(), 1);
  EXPECT_EQ(config.channel(), Channel::Blue);
  EXPECT_EQ(config.pixelOffset(), 0u);
  EXPECT_EQ(config.pixelStride(), 1u);
  EXPECT_EQ(config.startPosition().anchor, Anchor::TopLeft);
  EXPECT_FALSE(config.spread());
  EXPECT_FALSE(config.hasMarker());

  auto built = StegoConfig::Builder().build();
  ASSERT_TRUE(built);
  EXPECT_EQ(*built, config);
}

TEST(ConfigTest, StrideBelowOneClampsToOne) {
  EXPECT_EQ(StegoConfig::Builder().pixelStride(0).build()->pixelStride(), 1u);
  EXPECT_EQ(StegoConfig::Builder().pixelStride(-5).build()->pixelStride(), 1u);
  EXPECT_EQ(StegoConfig::Builder().pixelStride(4).build()->pixelStride(), 4u);
}

TEST(ConfigTest, RejectsInvalidValues) {
  for (int bpp : {0, 9, -1}) {
    auto config = StegoConfig::Builder().bitsPerPixel(bpp).build();
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error(), StegoError::InvalidConfig);
  }

  auto negative = StegoConfig::Builder().pixelOffset(-1).build();
  ASSERT_FALSE(negative);
  EXPECT_EQ(negative.error(), StegoError::InvalidConfig);

  auto outside =
      StegoConfig::Builder().startPosition(StartPosition::at(-1, 2)).build();
  EXPECT_FALSE(outside);
}

TEST(ConfigTest, ChannelFromIndex) {
  EXPECT_EQ(*channelFromIndex(0), Channel::Red);
  EXPECT_EQ(*channelFromIndex(1), Channel::Green);
  EXPECT_EQ(*channelFromIndex(2), Channel::Blue);
  EXPECT_EQ(channelFromIndex(3).error(), StegoError::InvalidChannel);
  EXPECT_EQ(channelFromIndex(-1).error(), StegoError::InvalidChannel);
}

TEST(ConfigTest, FromJson) {
  const json j = {{"bitsPerPixel", 2},
                  {"channel", "Green"},
                  {"pixelOffset", 5},
                  {"pixelStride", 0},
                  {"startPosition", {{"x", 3}, {"y", 4}}},
                  {"spread", true},
                  {"marker", "--"}};
  auto config = configFromJson(j);
  ASSERT_TRUE(config);
  EXPECT_EQ(config->bitsPerPixel(), 2);
  EXPECT_EQ(config->channel(), Channel::Green);
  EXPECT_EQ(config->pixelOffset(), 5u);
  EXPECT_EQ(config->pixelStride(), 1u);
  EXPECT_EQ(config->startPosition(), StartPosition::at(3, 4));
  EXPECT_TRUE(config->spread());
  EXPECT_EQ(config->marker(), (Bytes{'-', '-'}));
}

TEST(ConfigTest, FromJsonErrors) {
  EXPECT_EQ(configFromJson({{"channel", 5}}).error(),
            StegoError::InvalidChannel);
  EXPECT_EQ(configFromJson({{"channel", "purple"}}).error(),
            StegoError::InvalidChannel);
  EXPECT_EQ(configFromJson({{"startPosition", "middle"}}).error(),
            StegoError::InvalidConfig);
  EXPECT_EQ(configFromJson({{"bitsPerPixel", "two"}}).error(),
            StegoError::InvalidConfig);
  EXPECT_EQ(configFromJson({{"bitsPerPixel", 12}}).error(),
            StegoError::InvalidConfig);
  EXPECT_EQ(configFromJson(json::array({1, 2})).error(),
            StegoError::InvalidConfig);
}

TEST(ConfigTest, FromJsonRejectsNonIntegralNumbers) {
  EXPECT_EQ(configFromJson({{"bitsPerPixel", 2.7}}).error(),
            StegoError::InvalidConfig);
  EXPECT_EQ(configFromJson({{"pixelStride", 1.5}}).error(),
            StegoError::InvalidConfig);
  EXPECT_EQ(configFromJson({{"bitsPerPixel", 4294967298LL}}).error(),
            StegoError::InvalidConfig);
  EXPECT_EQ(configFromJson({{"pixelOffset", 18446744073709551615ULL}}).error(),
            StegoError::InvalidConfig);
  EXPECT_EQ(configFromJson({{"channel", 1.0}}).error(),
            StegoError::InvalidChannel);
  EXPECT_EQ(configFromJson({{"channel", 4294967297LL}}).error(),
            StegoError::InvalidChannel);
  EXPECT_EQ(configFromJson({{"startPosition", {{"x", 2.5}, {"y", 1}}}}).error(),
            StegoError::InvalidConfig);
  EXPECT_EQ(configFromJson({{"spread", 1}}).error(), StegoError::InvalidConfig);
}

TEST(ConfigTest, BinaryMarkerSerializesAsByteArray) {
  const Bytes marker{0xFF, 0x00, 0xFE};
  const auto config = *StegoConfig::Builder().marker(marker).build();

  const json j = toJson(config);
  ASSERT_TRUE(j.at("marker").is_array());
  EXPECT_EQ(j.at("marker"), json::array({255, 0, 254}));
  EXPECT_NO_THROW((void)j.dump());

  auto parsed = configFromJson(json::parse(j.dump()));
  ASSERT_TRUE(parsed);
  EXPECT_EQ(parsed->marker(), marker);
}

TEST(ConfigTest, MarkerArrayValidation) {
  auto config = configFromJson({{"marker", json::array({45, 45})}});
  ASSERT_TRUE(config);
  EXPECT_EQ(config->marker(), (Bytes{'-', '-'}));

  EXPECT_EQ(configFromJson({{"marker", json::array({256})}}).error(),
            StegoError::InvalidConfig);
  EXPECT_EQ(configFromJson({{"marker", json::array({-1})}}).error(),
            StegoError::InvalidConfig);
  EXPECT_EQ(configFromJson({{"marker", json::array({"a"})}}).error(),
            StegoError::InvalidConfig);
  EXPECT_EQ(configFromJson({{"marker", 7}}).error(), StegoError::InvalidConfig);
}

TEST(ConfigTest, JsonRoundTrip) {
  const auto config = *StegoConfig::Builder()
                           .bitsPerPixel(3)
                           .channel(Channel::Red)
                           .pixelOffset(7)
                           .pixelStride(2)
                           .startPosition({Anchor::Center})
                           .marker(std::string_view("EOF"))
                           .build();
  const json j = toJson(config);
  EXPECT_EQ(j.at("channel"), "red");
  EXPECT_EQ(j.at("startPosition"), "center");

  auto parsed = configFromJson(j);
  ASSERT_TRUE(parsed);
  EXPECT_EQ(*parsed, config);
}

TEST(ConfigTest, FromFile) {
  const auto path =
      std::filesystem::temp_directory_path() / "lsbkit_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"bitsPerPixel": 4, "channel": 0, "startPosition": "bottom-right"})";
  }
  auto config = configFromFile(path);
  std::filesystem::remove(path);
  ASSERT_TRUE(config);
  EXPECT_EQ(config->bitsPerPixel(), 4);
  EXPECT_EQ(config->channel(), Channel::Red);
  EXPECT_EQ(config->startPosition().anchor, Anchor::BottomRight);

  EXPECT_EQ(configFromFile(path).error(), StegoError::InvalidConfig);
}

TEST(ConfigTest, MalformedFile) {
  const auto path =
      std::filesystem::temp_directory_path() / "lsbkit_bad_config.json";
  {
    std::ofstream out(path);
    out << "{ not json";
  }
  auto config = configFromFile(path);
  std::filesystem::remove(path);
  ASSERT_FALSE(config);
  EXPECT_EQ(config.error(), StegoError::InvalidConfig);
}

TEST(ConfigTest, ErrorNames) {
  EXPECT_EQ(errorToString(StegoError::CapacityExceeded), "Capacity exceeded");
  EXPECT_EQ(errorToString(StegoError::InvalidUtf8), "Invalid UTF-8");
}
