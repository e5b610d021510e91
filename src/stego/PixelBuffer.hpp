#pragma once

#include "StegoConfig.hpp"
#include "StegoError.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <opencv2/core.hpp>

namespace lsbkit {

// 3-channel colour of a single pixel, RGB order
struct Rgb {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;

  [[nodiscard]] uint8_t operator[](Channel c) const noexcept {
    return c == Channel::Red ? r : c == Channel::Green ? g : b;
  }

  bool operator==(const Rgb &) const = default;
};

/**
 * @brief 8-bit RGB pixel buffer backed by a cv::Mat.
 *
 * Storage follows OpenCV's BGR layout; callers address channels in RGB
 * order through Channel. Unlike cv::Mat, copies own their pixel data.
 */
class PixelBuffer {
public:
  PixelBuffer() = default;

  /**
   * @brief Creates a zero-filled buffer.
   */
  PixelBuffer(int width, int height);

  PixelBuffer(const PixelBuffer &other) : mat_(other.mat_.clone()) {}
  PixelBuffer &operator=(const PixelBuffer &other);
  PixelBuffer(PixelBuffer &&) noexcept = default;
  PixelBuffer &operator=(PixelBuffer &&) noexcept = default;

  /**
   * @brief Wraps an OpenCV image, converting it to 8-bit BGR when needed.
   * @param image Grayscale, BGR or BGRA image of depth 8U or 16U.
   * @return The buffer, or StegoError::InvalidImage for empty or unsupported
   * images.
   */
  static auto fromMat(const cv::Mat &image)
      -> std::expected<PixelBuffer, StegoError>;

  [[nodiscard]] int width() const noexcept { return mat_.cols; }
  [[nodiscard]] int height() const noexcept { return mat_.rows; }
  [[nodiscard]] std::size_t pixelCount() const noexcept {
    return static_cast<std::size_t>(mat_.cols) * mat_.rows;
  }
  [[nodiscard]] bool empty() const noexcept { return mat_.empty(); }

  [[nodiscard]] uint8_t getChannelByte(int x, int y, Channel channel) const;
  void setChannelByte(int x, int y, Channel channel, uint8_t value);
  [[nodiscard]] Rgb color(int x, int y) const;

  [[nodiscard]] PixelBuffer clone() const;
  [[nodiscard]] const cv::Mat &mat() const noexcept { return mat_; }

private:
  explicit PixelBuffer(cv::Mat mat) : mat_(std::move(mat)) {}

  // BGR storage index of an RGB channel
  static constexpr int storageIndex(Channel c) noexcept {
    return 2 - static_cast<int>(c);
  }

  cv::Mat mat_;
};

} // namespace lsbkit
