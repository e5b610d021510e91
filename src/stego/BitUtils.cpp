#include "BitUtils.hpp"

namespace lsbkit::bits {

std::bitset<8> getBits(uint8_t byte, int count) noexcept {
  return std::bitset<8>(byte & lowMask(count));
}

} // namespace lsbkit::bits
