#include "StegoConfig.hpp"

#include "Utf8.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <limits>
#include <utility>
#include <spdlog/spdlog.h>
#include <string>

namespace lsbkit {

namespace {

constexpr std::pair<std::string_view, Anchor> kAnchorNames[] = {
    {"top-left", Anchor::TopLeft},       {"top-right", Anchor::TopRight},
    {"bottom-left", Anchor::BottomLeft}, {"bottom-right", Anchor::BottomRight},
    {"center", Anchor::Center}};

constexpr std::string_view kChannelNames[] = {"red", "green", "blue"};

auto anchorFromName(std::string_view name) -> std::optional<Anchor> {
  const auto *it = std::ranges::find(kAnchorNames, name,
                                     &std::pair<std::string_view, Anchor>::first);
  if (it == std::end(kAnchorNames))
    return std::nullopt;
  return it->second;
}

// Integral JSON number that fits in T; floats and out-of-range values fail
template <typename T>
auto integerFromJson(const json &value) -> std::optional<T> {
  if (!value.is_number_integer())
    return std::nullopt;
  if (value.is_number_unsigned()) {
    const auto v = value.get<std::uint64_t>();
    if (std::cmp_greater(v, std::numeric_limits<T>::max()))
      return std::nullopt;
    return static_cast<T>(v);
  }
  const auto v = value.get<std::int64_t>();
  if (!std::in_range<T>(v))
    return std::nullopt;
  return static_cast<T>(v);
}

auto channelFromJson(const json &value) -> std::expected<Channel, StegoError> {
  if (value.is_number_integer()) {
    if (auto index = integerFromJson<int>(value))
      return channelFromIndex(*index);
  }

  if (value.is_string()) {
    std::string name = value.get<std::string>();
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    const auto *it = std::ranges::find(kChannelNames, std::string_view(name));
    if (it != std::end(kChannelNames))
      return static_cast<Channel>(it - std::begin(kChannelNames));
  }

  spdlog::warn("Unrecognized channel value: {}", value.dump());
  return std::unexpected(StegoError::InvalidChannel);
}

auto startFromJson(const json &value)
    -> std::expected<StartPosition, StegoError> {
  if (value.is_string()) {
    if (auto anchor = anchorFromName(value.get<std::string>()))
      return StartPosition{*anchor};
  } else if (value.is_object() && value.contains("x") && value.contains("y")) {
    auto x = integerFromJson<int>(value.at("x"));
    auto y = integerFromJson<int>(value.at("y"));
    if (x && y)
      return StartPosition::at(*x, *y);
  }

  spdlog::warn("Unrecognized start position: {}", value.dump());
  return std::unexpected(StegoError::InvalidConfig);
}

// Marker as a string, or as an array of byte values for binary markers
auto markerFromJson(const json &value) -> std::expected<Bytes, StegoError> {
  if (value.is_string()) {
    const auto &text = value.get_ref<const std::string &>();
    return Bytes(text.begin(), text.end());
  }

  if (value.is_array()) {
    Bytes marker;
    marker.reserve(value.size());
    for (const auto &element : value) {
      auto byte = integerFromJson<uint8_t>(element);
      if (!byte) {
        spdlog::warn("Marker byte out of range: {}", element.dump());
        return std::unexpected(StegoError::InvalidConfig);
      }
      marker.push_back(*byte);
    }
    return marker;
  }

  spdlog::warn("Marker must be a string or an array of bytes");
  return std::unexpected(StegoError::InvalidConfig);
}

// Reads an optional integral key, reporting InvalidConfig for bad values
template <typename T>
auto optionalInteger(const json &j, const char *key)
    -> std::expected<std::optional<T>, StegoError> {
  if (!j.contains(key))
    return std::optional<T>{};
  auto value = integerFromJson<T>(j.at(key));
  if (!value) {
    spdlog::warn("'{}' must be an integer, got {}", key, j.at(key).dump());
    return std::unexpected(StegoError::InvalidConfig);
  }
  return value;
}

} // namespace

auto channelFromIndex(int index) noexcept
    -> std::expected<Channel, StegoError> {
  if (index < 0 || index > 2)
    return std::unexpected(StegoError::InvalidChannel);
  return static_cast<Channel>(index);
}

StegoConfig::Builder &StegoConfig::Builder::bitsPerPixel(int n) noexcept {
  bitsPerPixel_ = n;
  return *this;
}

StegoConfig::Builder &StegoConfig::Builder::channel(Channel c) noexcept {
  channel_ = c;
  return *this;
}

StegoConfig::Builder &
StegoConfig::Builder::pixelOffset(long long offset) noexcept {
  pixelOffset_ = offset;
  return *this;
}

StegoConfig::Builder &
StegoConfig::Builder::pixelStride(long long stride) noexcept {
  pixelStride_ = std::max(stride, 1LL);
  return *this;
}

StegoConfig::Builder &
StegoConfig::Builder::startPosition(StartPosition position) noexcept {
  start_ = position;
  return *this;
}

StegoConfig::Builder &StegoConfig::Builder::spread(bool enabled) noexcept {
  spread_ = enabled;
  return *this;
}

StegoConfig::Builder &StegoConfig::Builder::marker(Bytes bytes) {
  marker_ = std::move(bytes);
  return *this;
}

StegoConfig::Builder &StegoConfig::Builder::marker(std::string_view text) {
  marker_.assign(text.begin(), text.end());
  return *this;
}

auto StegoConfig::Builder::build() const
    -> std::expected<StegoConfig, StegoError> {
  if (bitsPerPixel_ < 1 || bitsPerPixel_ > 8) {
    spdlog::warn("bitsPerPixel must be within [1, 8], got {}", bitsPerPixel_);
    return std::unexpected(StegoError::InvalidConfig);
  }
  if (pixelOffset_ < 0) {
    spdlog::warn("pixelOffset must not be negative, got {}", pixelOffset_);
    return std::unexpected(StegoError::InvalidConfig);
  }
  if (start_.anchor == Anchor::At && (start_.x < 0 || start_.y < 0)) {
    spdlog::warn("Start position ({}, {}) is outside the image", start_.x,
                 start_.y);
    return std::unexpected(StegoError::InvalidConfig);
  }
  if (!channelFromIndex(static_cast<int>(channel_)))
    return std::unexpected(StegoError::InvalidChannel);

  StegoConfig config;
  config.bitsPerPixel_ = bitsPerPixel_;
  config.channel_ = channel_;
  config.pixelOffset_ = static_cast<std::size_t>(pixelOffset_);
  config.pixelStride_ = static_cast<std::size_t>(pixelStride_);
  config.start_ = start_;
  config.spread_ = spread_;
  config.marker_ = marker_;
  return config;
}

auto configFromJson(const json &j) -> std::expected<StegoConfig, StegoError> {
  if (!j.is_object()) {
    spdlog::warn("Configuration must be a JSON object");
    return std::unexpected(StegoError::InvalidConfig);
  }

  StegoConfig::Builder builder;

  auto bpp = optionalInteger<int>(j, "bitsPerPixel");
  auto offset = optionalInteger<long long>(j, "pixelOffset");
  auto stride = optionalInteger<long long>(j, "pixelStride");
  if (!bpp || !offset || !stride)
    return std::unexpected(StegoError::InvalidConfig);
  if (*bpp)
    builder.bitsPerPixel(**bpp);
  if (*offset)
    builder.pixelOffset(**offset);
  if (*stride)
    builder.pixelStride(**stride);

  if (j.contains("channel")) {
    auto channel = channelFromJson(j.at("channel"));
    if (!channel)
      return std::unexpected(channel.error());
    builder.channel(*channel);
  }
  if (j.contains("startPosition")) {
    auto start = startFromJson(j.at("startPosition"));
    if (!start)
      return std::unexpected(start.error());
    builder.startPosition(*start);
  }
  if (j.contains("spread")) {
    if (!j.at("spread").is_boolean()) {
      spdlog::warn("'spread' must be a boolean, got {}", j.at("spread").dump());
      return std::unexpected(StegoError::InvalidConfig);
    }
    builder.spread(j.at("spread").get<bool>());
  }
  if (j.contains("marker")) {
    auto marker = markerFromJson(j.at("marker"));
    if (!marker)
      return std::unexpected(marker.error());
    builder.marker(std::move(*marker));
  }

  return builder.build();
}

auto configFromFile(const std::filesystem::path &path)
    -> std::expected<StegoConfig, StegoError> {
  std::ifstream file(path);
  if (!file) {
    spdlog::error("Cannot open configuration file: {}", path.string());
    return std::unexpected(StegoError::InvalidConfig);
  }

  json j = json::parse(file, nullptr, false);
  if (j.is_discarded()) {
    spdlog::error("Malformed JSON in configuration file: {}", path.string());
    return std::unexpected(StegoError::InvalidConfig);
  }
  return configFromJson(j);
}

json toJson(const StegoConfig &config) {
  json j;
  j["bitsPerPixel"] = config.bitsPerPixel();
  j["channel"] = std::string(kChannelNames[static_cast<int>(config.channel())]);
  j["pixelOffset"] = config.pixelOffset();
  j["pixelStride"] = config.pixelStride();

  const auto start = config.startPosition();
  if (start.anchor == Anchor::At) {
    j["startPosition"] = {{"x", start.x}, {"y", start.y}};
  } else {
    for (const auto &[name, anchor] : kAnchorNames) {
      if (anchor == start.anchor)
        j["startPosition"] = std::string(name);
    }
  }

  j["spread"] = config.spread();
  if (config.hasMarker()) {
    const Bytes &marker = config.marker();
    if (isValidUtf8(marker))
      j["marker"] = std::string(marker.begin(), marker.end());
    else
      j["marker"] = marker;
  }
  return j;
}

} // namespace lsbkit
