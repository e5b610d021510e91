#pragma once

#include <bitset>
#include <cstdint>

namespace lsbkit::bits {

/**
 * @brief Mask covering the `count` low-order bits of a byte.
 * @param count Number of bits, in [0, 8].
 */
[[nodiscard]] constexpr uint8_t lowMask(int count) noexcept {
  return count >= 8 ? 0xFF : static_cast<uint8_t>((1u << count) - 1u);
}

/**
 * @brief Returns the `count` low-order bits of `byte`, bit 0 being the least
 * significant one.
 * @param byte The source byte.
 * @param count Number of bits to read (1-8).
 * @return The bits as a bitset; positions at or above `count` are cleared.
 */
[[nodiscard]] std::bitset<8> getBits(uint8_t byte, int count) noexcept;

/**
 * @brief Reads `count` bits of `byte` starting at `bitOffset`, shifted down to
 * position 0.
 */
[[nodiscard]] constexpr uint8_t extract(uint8_t byte, int bitOffset,
                                        int count) noexcept {
  return static_cast<uint8_t>((byte >> bitOffset) & lowMask(count));
}

/**
 * @brief Replaces bits [bitOffset, bitOffset + count) of `byte` with the low
 * `count` bits of `sourceBits`. All other bits are left untouched.
 * @param byte The byte to modify.
 * @param bitOffset First bit position to overwrite.
 * @param count Number of bits to overwrite (1-8).
 * @param sourceBits Bits to write, taken from its low-order end.
 * @return The modified byte.
 */
[[nodiscard]] constexpr uint8_t setBits(uint8_t byte, int bitOffset, int count,
                                        uint8_t sourceBits) noexcept {
  const auto mask = static_cast<uint8_t>(lowMask(count) << bitOffset);
  const auto value = static_cast<uint8_t>((sourceBits << bitOffset) & mask);
  return static_cast<uint8_t>((byte & ~mask) | value);
}

/**
 * @brief Number of per-pixel chunks a byte is split into.
 */
[[nodiscard]] constexpr int chunksPerByte(int bitsPerPixel) noexcept {
  return (8 + bitsPerPixel - 1) / bitsPerPixel;
}

/**
 * @brief Width of chunk `index` when a byte is sliced LSB-first into chunks of
 * `bitsPerPixel` bits. Only the last chunk can be narrower.
 */
[[nodiscard]] constexpr int chunkWidth(int bitsPerPixel, int index) noexcept {
  const int start = index * bitsPerPixel;
  return start + bitsPerPixel > 8 ? 8 - start : bitsPerPixel;
}

} // namespace lsbkit::bits
