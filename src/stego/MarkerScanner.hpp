#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <span>
#include <vector>

namespace lsbkit {

/**
 * @brief Sliding window over the most recent output bytes that detects an
 * exact terminator sequence. An empty marker disables the scanner.
 */
class MarkerScanner {
public:
  explicit MarkerScanner(std::span<const uint8_t> marker);

  /**
   * @brief Feeds one completed output byte.
   * @return True once the window equals the marker. The scanner stays matched
   * after that.
   */
  bool push(uint8_t byte);

  [[nodiscard]] bool enabled() const noexcept { return !marker_.empty(); }
  [[nodiscard]] bool matched() const noexcept { return matched_; }
  [[nodiscard]] std::size_t windowSize() const noexcept {
    return window_.size();
  }

private:
  std::vector<uint8_t> marker_;
  std::deque<uint8_t> window_;
  bool matched_ = false;
};

} // namespace lsbkit
