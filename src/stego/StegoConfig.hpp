#pragma once

#include "StegoError.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace lsbkit {

using json = nlohmann::json;
using Bytes = std::vector<uint8_t>;

// Colour channel carrying the payload bits, indexed in RGB order
enum class Channel : int { Red = 0, Green = 1, Blue = 2 };

/**
 * @brief Maps a raw channel index to a Channel.
 * @param index The raw index (0 = red, 1 = green, 2 = blue).
 * @return The channel, or StegoError::InvalidChannel.
 */
auto channelFromIndex(int index) noexcept -> std::expected<Channel, StegoError>;

// Anchor the traversal starts from
enum class Anchor { TopLeft, TopRight, BottomLeft, BottomRight, Center, At };

/**
 * @brief Starting position of the traversal. `x`/`y` are only meaningful for
 * Anchor::At.
 */
struct StartPosition {
  Anchor anchor = Anchor::TopLeft;
  int x = 0;
  int y = 0;

  static constexpr StartPosition at(int px, int py) noexcept {
    return {Anchor::At, px, py};
  }

  bool operator==(const StartPosition &) const = default;
};

/**
 * @brief Immutable embedding/extraction configuration shared by the encoder
 * and the decoder. Construct it with StegoConfig{} for the defaults, with
 * StegoConfig::Builder, or from JSON.
 */
class StegoConfig {
public:
  class Builder;

  StegoConfig() = default;

  [[nodiscard]] int bitsPerPixel() const noexcept { return bitsPerPixel_; }
  [[nodiscard]] Channel channel() const noexcept { return channel_; }
  [[nodiscard]] std::size_t pixelOffset() const noexcept { return pixelOffset_; }
  [[nodiscard]] std::size_t pixelStride() const noexcept { return pixelStride_; }
  [[nodiscard]] StartPosition startPosition() const noexcept { return start_; }
  [[nodiscard]] bool spread() const noexcept { return spread_; }
  // Decode-only; the encoder ignores it
  [[nodiscard]] const Bytes &marker() const noexcept { return marker_; }
  [[nodiscard]] bool hasMarker() const noexcept { return !marker_.empty(); }

  bool operator==(const StegoConfig &) const = default;

private:
  int bitsPerPixel_ = 1;
  Channel channel_ = Channel::Blue;
  std::size_t pixelOffset_ = 0;
  std::size_t pixelStride_ = 1;
  StartPosition start_{};
  bool spread_ = false;
  Bytes marker_;
};

/**
 * @brief Collects options and validates them into a StegoConfig.
 */
class StegoConfig::Builder {
public:
  Builder() = default;

  Builder &bitsPerPixel(int n) noexcept;
  Builder &channel(Channel c) noexcept;
  Builder &pixelOffset(long long offset) noexcept;
  // Values below 1 clamp to 1
  Builder &pixelStride(long long stride) noexcept;
  Builder &startPosition(StartPosition position) noexcept;
  Builder &spread(bool enabled) noexcept;
  Builder &marker(Bytes bytes);
  Builder &marker(std::string_view text);

  /**
   * @brief Validates the collected options.
   * @return The configuration, or StegoError::InvalidConfig when
   * bitsPerPixel is outside [1, 8], the offset is negative or an At position
   * has negative coordinates.
   */
  [[nodiscard]] auto build() const -> std::expected<StegoConfig, StegoError>;

private:
  int bitsPerPixel_ = 1;
  Channel channel_ = Channel::Blue;
  long long pixelOffset_ = 0;
  long long pixelStride_ = 1;
  StartPosition start_{};
  bool spread_ = false;
  Bytes marker_;
};

/**
 * @brief Reads a configuration from JSON. Missing keys keep their defaults.
 *
 * Recognized keys: bitsPerPixel, channel ("red"/"green"/"blue" or 0-2),
 * pixelOffset, pixelStride, startPosition ("top-left", "top-right",
 * "bottom-left", "bottom-right", "center" or {"x": .., "y": ..}), spread and
 * marker (string).
 */
auto configFromJson(const json &j) -> std::expected<StegoConfig, StegoError>;

/**
 * @brief Reads a JSON configuration file.
 */
auto configFromFile(const std::filesystem::path &path)
    -> std::expected<StegoConfig, StegoError>;

// Serializes a configuration with the schema configFromJson reads
json toJson(const StegoConfig &config);

} // namespace lsbkit
