#include "Decoder.hpp"

#include "BitUtils.hpp"
#include "ImageCodec.hpp"
#include "MarkerScanner.hpp"
#include "Traversal.hpp"

#include <spdlog/spdlog.h>

namespace lsbkit {

namespace {

constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

} // namespace

std::span<const uint8_t> DecodedResult::payload() const noexcept {
  std::span<const uint8_t> all(data_);
  if (hitMarker_ && markerLength_ <= all.size())
    return all.first(all.size() - markerLength_);
  return all;
}

std::string DecodedResult::asRawText() const {
  std::string text;
  text.reserve(data_.size());

  std::span<const uint8_t> rest(data_);
  while (!rest.empty()) {
    const std::size_t length = utf8SequenceLength(rest);
    if (length == 0) {
      text += kReplacementChar;
      rest = rest.subspan(utf8InvalidLength(rest));
      continue;
    }
    text.append(reinterpret_cast<const char *>(rest.data()), length);
    rest = rest.subspan(length);
  }
  return text;
}

auto DecodedResult::asText() const -> std::expected<std::string, StegoError> {
  std::span<const uint8_t> rest(data_);
  while (!rest.empty()) {
    const std::size_t length = utf8SequenceLength(rest);
    if (length == 0) {
      spdlog::debug("Invalid UTF-8 at byte {}", data_.size() - rest.size());
      return std::unexpected(StegoError::InvalidUtf8);
    }
    rest = rest.subspan(length);
  }
  return std::string(data_.begin(), data_.end());
}

DecodedResult decode(const StegoConfig &config, const PixelBuffer &source) {
  const auto started = std::chrono::steady_clock::now();

  const int bpp = config.bitsPerPixel();
  const Channel channel = config.channel();
  MarkerScanner scanner(config.marker());

  Bytes output;
  bool hitMarker = false;

  if (!source.empty()) {
    TraversalCursor cursor(config, source.width(), source.height());
    output.reserve(capacityBytes(config, source.width(), source.height()));

    uint8_t current = 0;
    int iterCount = 0;
    int chunk = 0;
    while (auto pixel = cursor.next()) {
      const int width = bits::chunkWidth(bpp, chunk);
      const auto lsb = bits::getBits(
          source.getChannelByte(pixel->x, pixel->y, channel), width);
      current = bits::setBits(current, iterCount, width,
                              static_cast<uint8_t>(lsb.to_ulong()));
      iterCount += width;
      ++chunk;

      if (iterCount < 8)
        continue;

      output.push_back(current);
      current = 0;
      iterCount = 0;
      chunk = 0;

      if (scanner.enabled() && scanner.push(output.back())) {
        hitMarker = true;
        break;
      }
    }
    spdlog::debug("Read {} bytes from {} pixel visits (marker hit: {})",
                  output.size(), cursor.visited(), hitMarker);
  } else {
    spdlog::warn("Decoding an empty image yields no data");
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - started);
  return DecodedResult(std::move(output), hitMarker, config.marker().size(),
                       elapsed);
}

auto decodeBytes(const StegoConfig &config, std::span<const uint8_t> imageBytes)
    -> std::expected<DecodedResult, StegoError> {
  auto image = loadImage(imageBytes);
  if (!image)
    return std::unexpected(StegoError::InvalidImage);
  return decode(config, *image);
}

auto decodeFile(const StegoConfig &config,
                const std::filesystem::path &imagePath)
    -> std::expected<DecodedResult, StegoError> {
  auto image = loadImageFile(imagePath);
  if (!image)
    return std::unexpected(StegoError::InvalidImage);
  return decode(config, *image);
}

} // namespace lsbkit
