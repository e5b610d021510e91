#include "Traversal.hpp"

#include "BitUtils.hpp"

#include <spdlog/spdlog.h>

namespace lsbkit {

std::size_t baseOffset(const StartPosition &start, int width,
                       int height) noexcept {
  const auto w = static_cast<std::size_t>(width);
  const auto h = static_cast<std::size_t>(height);
  switch (start.anchor) {
  case Anchor::TopLeft:
    return 0;
  case Anchor::TopRight:
    return w;
  case Anchor::BottomLeft:
    return h;
  case Anchor::BottomRight:
    return w + h;
  case Anchor::Center:
    return (w + h) / 2;
  case Anchor::At:
    return static_cast<std::size_t>(start.x) * static_cast<std::size_t>(start.y);
  }
  return 0;
}

std::size_t startIndex(const StegoConfig &config, int width,
                       int height) noexcept {
  return baseOffset(config.startPosition(), width, height) +
         config.pixelOffset();
}

std::size_t firstPassVisits(const StegoConfig &config, int width,
                            int height) noexcept {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  const std::size_t start = startIndex(config, width, height);
  if (start >= pixels)
    return 0;
  const std::size_t stride = config.pixelStride();
  return (pixels - start + stride - 1) / stride;
}

std::size_t availableVisits(const StegoConfig &config, int width,
                            int height) noexcept {
  if (config.spread())
    return static_cast<std::size_t>(width) * height;
  return firstPassVisits(config, width, height);
}

std::size_t requiredVisits(std::size_t payloadSize, int bitsPerPixel) noexcept {
  return payloadSize * static_cast<std::size_t>(bits::chunksPerByte(bitsPerPixel));
}

std::size_t capacityBytes(const StegoConfig &config, int width,
                          int height) noexcept {
  return availableVisits(config, width, height) /
         static_cast<std::size_t>(bits::chunksPerByte(config.bitsPerPixel()));
}

auto checkCapacity(std::size_t payloadSize, const StegoConfig &config,
                   int width, int height) -> std::expected<void, StegoError> {
  const std::size_t required = requiredVisits(payloadSize, config.bitsPerPixel());
  const std::size_t available = availableVisits(config, width, height);
  if (required > available) {
    spdlog::warn("Payload of {} bytes needs {} pixel visits, only {} "
                 "available (spread: {})",
                 payloadSize, required, available, config.spread());
    return std::unexpected(StegoError::CapacityExceeded);
  }
  return {};
}

TraversalCursor::TraversalCursor(const StegoConfig &config, int width,
                                 int height) noexcept
    : width_(width), height_(height),
      pixelCount_(static_cast<std::size_t>(width) * height),
      start_(startIndex(config, width, height)), stride_(config.pixelStride()),
      spread_(config.spread()), limit_(availableVisits(config, width, height)) {
  reset();
}

void TraversalCursor::reset() noexcept {
  position_ = start_;
  visited_ = 0;
  spreadPass_ = false;
}

bool TraversalCursor::visitedByFirstPass(std::size_t index) const noexcept {
  return index >= start_ && (index - start_) % stride_ == 0;
}

PixelAddress TraversalCursor::address(std::size_t index) const noexcept {
  return {static_cast<int>(index % width_), static_cast<int>(index / width_),
          index};
}

std::optional<PixelAddress> TraversalCursor::next() noexcept {
  if (visited_ >= limit_)
    return std::nullopt;

  if (!spreadPass_) {
    if (position_ < pixelCount_) {
      const std::size_t index = position_;
      position_ += stride_;
      ++visited_;
      return address(index);
    }
    if (!spread_)
      return std::nullopt;
    spreadPass_ = true;
    position_ = 0;
    spdlog::trace("Cursor wrapped after {} visits", visited_);
  }

  while (position_ < pixelCount_ && visitedByFirstPass(position_))
    ++position_;
  if (position_ >= pixelCount_)
    return std::nullopt;

  ++visited_;
  return address(position_++);
}

} // namespace lsbkit
