#include "PixelBuffer.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

namespace lsbkit {

PixelBuffer::PixelBuffer(int width, int height)
    : mat_(cv::Mat::zeros(height, width, CV_8UC3)) {}

PixelBuffer &PixelBuffer::operator=(const PixelBuffer &other) {
  if (this != &other)
    mat_ = other.mat_.clone();
  return *this;
}

auto PixelBuffer::fromMat(const cv::Mat &image)
    -> std::expected<PixelBuffer, StegoError> {
  if (image.empty()) {
    spdlog::error("Cannot build a pixel buffer from an empty image");
    return std::unexpected(StegoError::InvalidImage);
  }

  cv::Mat depth8;
  switch (image.depth()) {
  case CV_8U:
    depth8 = image;
    break;
  case CV_16U:
    image.convertTo(depth8, CV_8U, 1.0 / 257.0);
    break;
  default:
    spdlog::error("Unsupported image depth: {}", image.depth());
    return std::unexpected(StegoError::InvalidImage);
  }

  cv::Mat bgr;
  switch (depth8.channels()) {
  case 1:
    cv::cvtColor(depth8, bgr, cv::COLOR_GRAY2BGR);
    break;
  case 3:
    bgr = depth8.clone();
    break;
  case 4:
    cv::cvtColor(depth8, bgr, cv::COLOR_BGRA2BGR);
    break;
  default:
    spdlog::error("Unsupported channel count: {}", depth8.channels());
    return std::unexpected(StegoError::InvalidImage);
  }

  return PixelBuffer(std::move(bgr));
}

uint8_t PixelBuffer::getChannelByte(int x, int y, Channel channel) const {
  return mat_.at<cv::Vec3b>(y, x)[storageIndex(channel)];
}

void PixelBuffer::setChannelByte(int x, int y, Channel channel,
                                 uint8_t value) {
  mat_.at<cv::Vec3b>(y, x)[storageIndex(channel)] = value;
}

Rgb PixelBuffer::color(int x, int y) const {
  const cv::Vec3b &pixel = mat_.at<cv::Vec3b>(y, x);
  return {pixel[2], pixel[1], pixel[0]};
}

PixelBuffer PixelBuffer::clone() const { return PixelBuffer(mat_.clone()); }

} // namespace lsbkit
