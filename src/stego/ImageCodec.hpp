#ifndef LSBKIT_IMAGECODEC_HPP
#define LSBKIT_IMAGECODEC_HPP

#include "PixelBuffer.hpp"
#include "StegoError.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace lsbkit {

namespace fs = std::filesystem;

// Container formats the codec can write
enum class ImageFormat { Jpeg, Png, Bmp };

/**
 * @brief Picks the output format from a file extension (.jpg, .jpeg, .png,
 * .bmp, case-insensitive).
 * @return The format or StegoError::UnsupportedFormat.
 */
auto formatFromPath(const fs::path &path) noexcept
    -> std::expected<ImageFormat, StegoError>;

// Canonical file extension for a format, with the leading dot
std::string_view formatExtension(ImageFormat format) noexcept;

/**
 * @brief Whether a byte stream of this length can be handed to the decoder.
 * OpenCV indexes the stream with an int, so streams of 2 GiB or more and
 * empty streams are refused.
 */
[[nodiscard]] bool isDecodableSize(std::size_t byteCount) noexcept;

/**
 * @brief Decodes an encoded image (JPEG, PNG, BMP, ...) held in memory.
 * @param bytes The container byte stream.
 * @return The decoded pixels or StegoError::InvalidImage.
 */
auto loadImage(std::span<const uint8_t> bytes) noexcept
    -> std::expected<PixelBuffer, StegoError>;

/**
 * @brief Loads and decodes an image file.
 * @param filename The path to the image file.
 * @return The decoded pixels or StegoError::InvalidImage.
 */
auto loadImageFile(const fs::path &filename) noexcept
    -> std::expected<PixelBuffer, StegoError>;

/**
 * @brief Encodes pixels into a container byte stream.
 * @param image The pixels to encode.
 * @param format The container format.
 * @param quality JPEG quality (0-100), ignored by the lossless formats.
 * @return The encoded bytes or StegoError::WriteFailure.
 */
auto encodeImage(const PixelBuffer &image, ImageFormat format,
                 int quality = 95) noexcept
    -> std::expected<std::vector<uint8_t>, StegoError>;

/**
 * @brief Saves pixels to a file in the given format.
 * @param filename The path to the output file.
 * @param image The pixels to save.
 * @param format The container format.
 * @param quality JPEG quality (0-100).
 * @return Success or StegoError::WriteFailure.
 */
auto saveImage(const fs::path &filename, const PixelBuffer &image,
               ImageFormat format, int quality = 95) noexcept
    -> std::expected<void, StegoError>;

} // namespace lsbkit

#endif // LSBKIT_IMAGECODEC_HPP
