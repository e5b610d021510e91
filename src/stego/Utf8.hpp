#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace lsbkit {

/**
 * @brief Length of the valid UTF-8 sequence starting at `text[0]`, or 0 when
 * it is malformed (overlong, surrogate, out of range or truncated).
 */
[[nodiscard]] std::size_t utf8SequenceLength(
    std::span<const uint8_t> text) noexcept;

/**
 * @brief Length of the maximal invalid subpart starting at `text[0]`: the
 * longest prefix that could still begin a well-formed sequence, at least one
 * byte. Lossy decoding replaces it with a single U+FFFD.
 */
[[nodiscard]] std::size_t utf8InvalidLength(
    std::span<const uint8_t> text) noexcept;

// True when the whole buffer is well-formed UTF-8
[[nodiscard]] bool isValidUtf8(std::span<const uint8_t> text) noexcept;

} // namespace lsbkit
