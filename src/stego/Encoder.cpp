#include "Encoder.hpp"

#include "BitUtils.hpp"
#include "Traversal.hpp"

#include <numeric>
#include <opencv2/core.hpp>
#include <spdlog/spdlog.h>

namespace lsbkit {

std::size_t EncodedResult::pixelsChanged() const noexcept {
  std::size_t count = 0;
  for (const auto &map : changes_) {
    for (const auto &record : map.changes) {
      if (record.changed())
        ++count;
    }
  }
  return count;
}

std::size_t EncodedResult::pixelsTouched() const noexcept {
  return std::accumulate(changes_.begin(), changes_.end(), std::size_t{0},
                         [](std::size_t sum, const ByteEncodeMap &map) {
                           return sum + map.changes.size();
                         });
}

cv::Mat EncodedResult::diffMask() const {
  cv::Mat diff;
  cv::absdiff(original_.mat(), altered_.mat(), diff);

  std::vector<cv::Mat> planes;
  cv::split(diff, planes);
  cv::Mat combined = planes[0] | planes[1] | planes[2];

  cv::Mat mask;
  cv::compare(combined, 0, mask, cv::CMP_GT);
  return mask;
}

nlohmann::json EncodedResult::toJson() const {
  auto rgb = [](const Rgb &c) { return nlohmann::json::array({c.r, c.g, c.b}); };

  nlohmann::json out = nlohmann::json::array();
  for (const auto &map : changes_) {
    nlohmann::json records = nlohmann::json::array();
    for (const auto &record : map.changes) {
      records.push_back({{"x", record.x},
                         {"y", record.y},
                         {"from", rgb(record.original)},
                         {"to", rgb(record.altered)}});
    }
    out.push_back({{"byte", map.sourceByte}, {"changes", std::move(records)}});
  }
  return out;
}

auto EncodedResult::write(ImageFormat format, int quality) const
    -> std::expected<std::vector<uint8_t>, StegoError> {
  if (format == ImageFormat::Jpeg)
    spdlog::warn("JPEG output is lossy, embedded bits will not survive");
  return encodeImage(altered_, format, quality);
}

auto EncodedResult::save(const std::filesystem::path &path,
                         ImageFormat format) const
    -> std::expected<void, StegoError> {
  if (format == ImageFormat::Jpeg)
    spdlog::warn("JPEG output is lossy, embedded bits will not survive");
  return saveImage(path, altered_, format);
}

auto EncodedResult::save(const std::filesystem::path &path) const
    -> std::expected<void, StegoError> {
  auto format = formatFromPath(path);
  if (!format)
    return std::unexpected(format.error());
  return save(path, *format);
}

auto encode(std::span<const uint8_t> payload, const StegoConfig &config,
            const PixelBuffer &source)
    -> std::expected<EncodedResult, StegoError> {
  if (source.empty()) {
    spdlog::error("Cannot encode into an empty image");
    return std::unexpected(StegoError::InvalidImage);
  }
  if (!channelFromIndex(static_cast<int>(config.channel())))
    return std::unexpected(StegoError::InvalidChannel);

  if (auto fits = checkCapacity(payload.size(), config, source.width(),
                                source.height());
      !fits) {
    return std::unexpected(fits.error());
  }

  const int bpp = config.bitsPerPixel();
  const int chunks = bits::chunksPerByte(bpp);
  const Channel channel = config.channel();

  PixelBuffer working = source.clone();
  TraversalCursor cursor(config, working.width(), working.height());

  std::vector<ByteEncodeMap> maps;
  maps.reserve(payload.size());

  for (uint8_t byte : payload) {
    ByteEncodeMap map{byte, {}};
    map.changes.reserve(chunks);

    for (int chunk = 0; chunk < chunks; ++chunk) {
      auto pixel = cursor.next();
      if (!pixel) {
        spdlog::error("Cursor exhausted after {} visits", cursor.visited());
        return std::unexpected(StegoError::CapacityExceeded);
      }

      const int width = bits::chunkWidth(bpp, chunk);
      const uint8_t value = bits::extract(byte, chunk * bpp, width);

      const Rgb before = working.color(pixel->x, pixel->y);
      const uint8_t current = working.getChannelByte(pixel->x, pixel->y, channel);
      working.setChannelByte(pixel->x, pixel->y, channel,
                             bits::setBits(current, 0, width, value));

      map.changes.push_back(
          {pixel->x, pixel->y, before, working.color(pixel->x, pixel->y)});
      spdlog::trace("Pixel ({}, {}) channel {} {:#04x} -> {:#04x}", pixel->x,
                    pixel->y, static_cast<int>(channel), current,
                    working.getChannelByte(pixel->x, pixel->y, channel));
    }
    maps.push_back(std::move(map));
  }

  spdlog::debug("Embedded {} bytes in {} pixel visits ({}x{}, {} bpp, "
                "spread: {})",
                payload.size(), cursor.visited(), working.width(),
                working.height(), bpp, config.spread());

  return EncodedResult(std::move(working), source.clone(), std::move(maps));
}

auto encodeBytes(std::span<const uint8_t> payload, const StegoConfig &config,
                 std::span<const uint8_t> imageBytes)
    -> std::expected<EncodedResult, StegoError> {
  auto image = loadImage(imageBytes);
  if (!image)
    return std::unexpected(StegoError::InvalidImage);
  return encode(payload, config, *image);
}

auto encodeFile(std::span<const uint8_t> payload, const StegoConfig &config,
                const std::filesystem::path &imagePath)
    -> std::expected<EncodedResult, StegoError> {
  auto image = loadImageFile(imagePath);
  if (!image)
    return std::unexpected(StegoError::InvalidImage);
  return encode(payload, config, *image);
}

} // namespace lsbkit
