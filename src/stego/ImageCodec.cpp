#include "ImageCodec.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <limits>
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace lsbkit {

namespace {

// Encoder parameters for cv::imencode
[[nodiscard]] std::vector<int> encodeParams(ImageFormat format,
                                            int quality) noexcept {
  switch (format) {
  case ImageFormat::Jpeg:
    return {cv::IMWRITE_JPEG_QUALITY, std::clamp(quality, 0, 100)};
  case ImageFormat::Png:
    return {cv::IMWRITE_PNG_COMPRESSION, 9};
  default:
    return {};
  }
}

} // namespace

auto formatFromPath(const fs::path &path) noexcept
    -> std::expected<ImageFormat, StegoError> {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (ext == ".jpg" || ext == ".jpeg")
    return ImageFormat::Jpeg;
  if (ext == ".png")
    return ImageFormat::Png;
  if (ext == ".bmp")
    return ImageFormat::Bmp;

  spdlog::warn("Unsupported output extension: '{}'", ext);
  return std::unexpected(StegoError::UnsupportedFormat);
}

std::string_view formatExtension(ImageFormat format) noexcept {
  switch (format) {
  case ImageFormat::Jpeg:
    return ".jpg";
  case ImageFormat::Png:
    return ".png";
  case ImageFormat::Bmp:
    return ".bmp";
  default:
    return "";
  }
}

bool isDecodableSize(std::size_t byteCount) noexcept {
  return byteCount > 0 &&
         byteCount <= static_cast<std::size_t>(std::numeric_limits<int>::max());
}

auto loadImage(std::span<const uint8_t> bytes) noexcept
    -> std::expected<PixelBuffer, StegoError> {
  if (bytes.empty()) {
    spdlog::error("Cannot decode an empty byte stream");
    return std::unexpected(StegoError::InvalidImage);
  }
  if (!isDecodableSize(bytes.size())) {
    spdlog::error("Image stream of {} bytes is too large to decode",
                  bytes.size());
    return std::unexpected(StegoError::InvalidImage);
  }

  try {
    const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                      const_cast<uint8_t *>(bytes.data()));
    cv::Mat image = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
    if (image.empty()) {
      spdlog::error("Could not decode image ({} bytes)", bytes.size());
      return std::unexpected(StegoError::InvalidImage);
    }
    spdlog::debug("Decoded {}x{} image with {} channels", image.cols,
                  image.rows, image.channels());
    return PixelBuffer::fromMat(image);
  } catch (const cv::Exception &e) {
    spdlog::error("OpenCV error while decoding image: {}", e.what());
    return std::unexpected(StegoError::InvalidImage);
  }
}

auto loadImageFile(const fs::path &filename) noexcept
    -> std::expected<PixelBuffer, StegoError> {
  std::error_code ec;
  if (!fs::exists(filename, ec)) {
    spdlog::error("Image file not found: {}", filename.string());
    return std::unexpected(StegoError::InvalidImage);
  }

  std::ifstream file(filename, std::ios::binary);
  if (!file) {
    spdlog::error("Cannot open image file: {}", filename.string());
    return std::unexpected(StegoError::InvalidImage);
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
  spdlog::info("Loading image: {}", filename.string());
  return loadImage(bytes);
}

auto encodeImage(const PixelBuffer &image, ImageFormat format,
                 int quality) noexcept
    -> std::expected<std::vector<uint8_t>, StegoError> {
  if (image.empty()) {
    spdlog::error("Cannot encode an empty image");
    return std::unexpected(StegoError::WriteFailure);
  }

  try {
    std::vector<uint8_t> out;
    const std::string ext(formatExtension(format));
    if (!cv::imencode(ext, image.mat(), out, encodeParams(format, quality))) {
      spdlog::error("OpenCV refused to encode {} image", ext);
      return std::unexpected(StegoError::WriteFailure);
    }
    return out;
  } catch (const cv::Exception &e) {
    spdlog::error("OpenCV error while encoding image: {}", e.what());
    return std::unexpected(StegoError::WriteFailure);
  }
}

auto saveImage(const fs::path &filename, const PixelBuffer &image,
               ImageFormat format, int quality) noexcept
    -> std::expected<void, StegoError> {
  auto encoded = encodeImage(image, format, quality);
  if (!encoded)
    return std::unexpected(encoded.error());

  std::error_code ec;
  if (filename.has_parent_path())
    fs::create_directories(filename.parent_path(), ec);

  std::ofstream file(filename, std::ios::binary | std::ios::trunc);
  if (!file) {
    spdlog::error("Cannot open output file: {}", filename.string());
    return std::unexpected(StegoError::WriteFailure);
  }
  file.write(reinterpret_cast<const char *>(encoded->data()),
             static_cast<std::streamsize>(encoded->size()));
  if (!file) {
    spdlog::error("Failed to write image: {}", filename.string());
    return std::unexpected(StegoError::WriteFailure);
  }

  spdlog::info("Saved image: {}", filename.string());
  return {};
}

} // namespace lsbkit
