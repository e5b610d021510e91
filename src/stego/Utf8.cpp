#include "Utf8.hpp"

namespace lsbkit {

namespace {

// Expected length and second-byte bounds for a lead byte
struct LeadInfo {
  std::size_t length = 0;
  uint8_t lowest = 0x80;
  uint8_t highest = 0xBF;
};

[[nodiscard]] constexpr LeadInfo leadInfo(uint8_t lead) noexcept {
  if (lead < 0x80)
    return {1};
  if (lead >= 0xC2 && lead <= 0xDF)
    return {2};
  if (lead == 0xE0)
    return {3, 0xA0, 0xBF}; // overlong
  if (lead == 0xED)
    return {3, 0x80, 0x9F}; // surrogates
  if (lead >= 0xE1 && lead <= 0xEF)
    return {3};
  if (lead == 0xF0)
    return {4, 0x90, 0xBF};
  if (lead == 0xF4)
    return {4, 0x80, 0x8F}; // above U+10FFFF
  if (lead >= 0xF1 && lead <= 0xF3)
    return {4};
  return {};
}

// Number of leading bytes consistent with a well-formed sequence
[[nodiscard]] std::size_t validPrefix(std::span<const uint8_t> text,
                                      const LeadInfo &info) noexcept {
  std::size_t i = 1;
  for (; i < info.length && i < text.size(); ++i) {
    const uint8_t byte = text[i];
    const uint8_t lowest = i == 1 ? info.lowest : 0x80;
    const uint8_t highest = i == 1 ? info.highest : 0xBF;
    if (byte < lowest || byte > highest)
      break;
  }
  return i;
}

} // namespace

std::size_t utf8SequenceLength(std::span<const uint8_t> text) noexcept {
  if (text.empty())
    return 0;
  const LeadInfo info = leadInfo(text[0]);
  if (info.length == 0)
    return 0;
  return validPrefix(text, info) == info.length ? info.length : 0;
}

std::size_t utf8InvalidLength(std::span<const uint8_t> text) noexcept {
  if (text.empty())
    return 0;
  const LeadInfo info = leadInfo(text[0]);
  if (info.length == 0)
    return 1;
  return validPrefix(text, info);
}

bool isValidUtf8(std::span<const uint8_t> text) noexcept {
  while (!text.empty()) {
    const std::size_t length = utf8SequenceLength(text);
    if (length == 0)
      return false;
    text = text.subspan(length);
  }
  return true;
}

} // namespace lsbkit
