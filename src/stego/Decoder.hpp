#pragma once

#include "PixelBuffer.hpp"
#include "StegoConfig.hpp"
#include "StegoError.hpp"
#include "Utf8.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace lsbkit {

/**
 * @brief Bytes recovered by a decode call.
 *
 * embeddedData() is the raw output, marker bytes included when the marker
 * was hit. payload() is the same sequence with the marker trimmed.
 */
class DecodedResult {
public:
  DecodedResult(Bytes data, bool hitMarker, std::size_t markerLength,
                std::chrono::microseconds elapsed)
      : data_(std::move(data)), hitMarker_(hitMarker),
        markerLength_(markerLength), elapsed_(elapsed) {}

  [[nodiscard]] const Bytes &embeddedData() const noexcept { return data_; }
  [[nodiscard]] std::span<const uint8_t> payload() const noexcept;

  // Decoding stopped because the configured marker was found
  [[nodiscard]] bool hitMarker() const noexcept { return hitMarker_; }
  [[nodiscard]] std::chrono::microseconds elapsed() const noexcept {
    return elapsed_;
  }

  // UTF-8 view with invalid sequences replaced by U+FFFD
  [[nodiscard]] std::string asRawText() const;

  /**
   * @brief Strict UTF-8 view of the raw data.
   * @return The text, or StegoError::InvalidUtf8.
   */
  [[nodiscard]] auto asText() const -> std::expected<std::string, StegoError>;

private:
  Bytes data_;
  bool hitMarker_;
  std::size_t markerLength_;
  std::chrono::microseconds elapsed_;
};

/**
 * @brief Reads embedded bytes back out of `source`.
 *
 * Visits pixels in cursor order, collecting bitsPerPixel low bits of the
 * configured channel per pixel, LSB-first, until the cursor is exhausted or
 * the configured marker has been read. Running out of pixels is a normal
 * end, not an error; a trailing partial byte is dropped.
 */
[[nodiscard]] DecodedResult decode(const StegoConfig &config,
                                   const PixelBuffer &source);

// Decodes `imageBytes` with the codec, then extracts
auto decodeBytes(const StegoConfig &config, std::span<const uint8_t> imageBytes)
    -> std::expected<DecodedResult, StegoError>;

// Loads `imagePath` with the codec, then extracts
auto decodeFile(const StegoConfig &config,
                const std::filesystem::path &imagePath)
    -> std::expected<DecodedResult, StegoError>;

} // namespace lsbkit
