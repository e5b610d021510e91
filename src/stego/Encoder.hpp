#pragma once

#include "ImageCodec.hpp"
#include "PixelBuffer.hpp"
#include "StegoConfig.hpp"
#include "StegoError.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <span>
#include <vector>

namespace lsbkit {

// One pixel touched by the encoder
struct ChangeRecord {
  int x = 0;
  int y = 0;
  Rgb original;
  Rgb altered;

  [[nodiscard]] bool changed() const noexcept { return original != altered; }
};

// All pixels written for one payload byte, in visit order
struct ByteEncodeMap {
  uint8_t sourceByte = 0;
  std::vector<ChangeRecord> changes;
};

/**
 * @brief Result of a successful encode call: the altered pixels, the
 * untouched original for diffing, and the per-byte change log.
 */
class EncodedResult {
public:
  EncodedResult(PixelBuffer altered, PixelBuffer original,
                std::vector<ByteEncodeMap> changes)
      : altered_(std::move(altered)), original_(std::move(original)),
        changes_(std::move(changes)) {}

  [[nodiscard]] const std::vector<ByteEncodeMap> &changes() const noexcept {
    return changes_;
  }

  // Pixels whose colour actually differs from the original
  [[nodiscard]] std::size_t pixelsChanged() const noexcept;
  // Pixels visited and rewritten, including those left with the same value
  [[nodiscard]] std::size_t pixelsTouched() const noexcept;

  [[nodiscard]] const PixelBuffer &altered() const noexcept { return altered_; }
  [[nodiscard]] const PixelBuffer &original() const noexcept {
    return original_;
  }

  /**
   * @brief Single channel 8-bit mask, 255 where the altered image differs
   * from the original.
   */
  [[nodiscard]] cv::Mat diffMask() const;

  // Change log as JSON: [{"byte", "changes": [{"x", "y", "from", "to"}]}]
  [[nodiscard]] nlohmann::json toJson() const;

  /**
   * @brief Encodes the altered pixels into a container byte stream.
   */
  [[nodiscard]] auto write(ImageFormat format, int quality = 95) const
      -> std::expected<std::vector<uint8_t>, StegoError>;

  /**
   * @brief Saves the altered pixels. JPEG is lossy and destroys the embedded
   * bits; use PNG or BMP for anything meant to be decoded again.
   */
  [[nodiscard]] auto save(const std::filesystem::path &path,
                          ImageFormat format) const
      -> std::expected<void, StegoError>;

  // Same as above, the format being picked from the file extension
  [[nodiscard]] auto save(const std::filesystem::path &path) const
      -> std::expected<void, StegoError>;

private:
  PixelBuffer altered_;
  PixelBuffer original_;
  std::vector<ByteEncodeMap> changes_;
};

/**
 * @brief Embeds a payload into a copy of `source`.
 *
 * Each payload byte is split LSB-first into chunks of bitsPerPixel bits, one
 * chunk per visited pixel, written into the low bits of the configured
 * channel. The capacity check runs before anything is written, and the
 * source buffer is never modified.
 *
 * @param payload The bytes to embed.
 * @param config The embedding configuration (marker is ignored).
 * @param source The cover pixels, at least one pixel.
 * @return The encoded result, StegoError::CapacityExceeded when the payload
 * does not fit, or StegoError::InvalidImage for an empty source.
 */
auto encode(std::span<const uint8_t> payload, const StegoConfig &config,
            const PixelBuffer &source)
    -> std::expected<EncodedResult, StegoError>;

// Decodes `imageBytes` with the codec, then embeds
auto encodeBytes(std::span<const uint8_t> payload, const StegoConfig &config,
                 std::span<const uint8_t> imageBytes)
    -> std::expected<EncodedResult, StegoError>;

// Loads `imagePath` with the codec, then embeds
auto encodeFile(std::span<const uint8_t> payload, const StegoConfig &config,
                const std::filesystem::path &imagePath)
    -> std::expected<EncodedResult, StegoError>;

} // namespace lsbkit
