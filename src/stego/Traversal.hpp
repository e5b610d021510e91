#pragma once

#include "StegoConfig.hpp"
#include "StegoError.hpp"

#include <cstddef>
#include <expected>
#include <optional>

namespace lsbkit {

// A pixel visited by the cursor; index is the row-major pixel index
struct PixelAddress {
  int x = 0;
  int y = 0;
  std::size_t index = 0;

  bool operator==(const PixelAddress &) const = default;
};

/**
 * @brief Coarse pixel offset derived from the start position.
 *
 * TopLeft -> 0, TopRight -> width, BottomLeft -> height, BottomRight ->
 * width + height, Center -> (width + height) / 2, At(x, y) -> x * y.
 */
[[nodiscard]] std::size_t baseOffset(const StartPosition &start, int width,
                                     int height) noexcept;

// Row-major index of the first pixel visited: base offset + pixelOffset
[[nodiscard]] std::size_t startIndex(const StegoConfig &config, int width,
                                     int height) noexcept;

/**
 * @brief Number of pixels the first pass visits (stride applied from the
 * start index up to the end of the image).
 */
[[nodiscard]] std::size_t firstPassVisits(const StegoConfig &config, int width,
                                          int height) noexcept;

/**
 * @brief Exact number of addresses the cursor yields for this configuration:
 * the first pass, or every pixel of the image once when spread is enabled.
 */
[[nodiscard]] std::size_t availableVisits(const StegoConfig &config, int width,
                                          int height) noexcept;

// Pixel visits needed to embed `payloadSize` bytes
[[nodiscard]] std::size_t requiredVisits(std::size_t payloadSize,
                                         int bitsPerPixel) noexcept;

// Largest payload, in bytes, that fits under this configuration
[[nodiscard]] std::size_t capacityBytes(const StegoConfig &config, int width,
                                        int height) noexcept;

/**
 * @brief Checks up front whether a payload fits.
 * @return Nothing on success, StegoError::CapacityExceeded otherwise.
 */
auto checkCapacity(std::size_t payloadSize, const StegoConfig &config,
                   int width, int height) -> std::expected<void, StegoError>;

/**
 * @brief Produces the deterministic sequence of pixels to visit.
 *
 * The first pass yields every pixelStride-th pixel in row-major order from
 * startIndex(). With spread enabled a second pass then walks the image again
 * from index 0, yielding the pixels the first pass skipped, until every
 * pixel of the image has been visited once.
 */
class TraversalCursor {
public:
  TraversalCursor(const StegoConfig &config, int width, int height) noexcept;

  /**
   * @brief Advances to the next pixel.
   * @return The pixel, or std::nullopt once the sequence is exhausted.
   */
  [[nodiscard]] std::optional<PixelAddress> next() noexcept;

  // Rewinds to the first address
  void reset() noexcept;

  [[nodiscard]] std::size_t visited() const noexcept { return visited_; }
  [[nodiscard]] std::size_t limit() const noexcept { return limit_; }
  [[nodiscard]] bool inSpreadPass() const noexcept { return spreadPass_; }

private:
  [[nodiscard]] bool visitedByFirstPass(std::size_t index) const noexcept;
  [[nodiscard]] PixelAddress address(std::size_t index) const noexcept;

  int width_;
  int height_;
  std::size_t pixelCount_;
  std::size_t start_;
  std::size_t stride_;
  bool spread_;
  std::size_t limit_;

  std::size_t position_ = 0;
  std::size_t visited_ = 0;
  bool spreadPass_ = false;
};

} // namespace lsbkit
