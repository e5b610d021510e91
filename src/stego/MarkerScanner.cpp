#include "MarkerScanner.hpp"

#include <algorithm>

namespace lsbkit {

MarkerScanner::MarkerScanner(std::span<const uint8_t> marker)
    : marker_(marker.begin(), marker.end()) {}

bool MarkerScanner::push(uint8_t byte) {
  if (!enabled() || matched_)
    return matched_;

  window_.push_back(byte);
  if (window_.size() > marker_.size())
    window_.pop_front();

  if (window_.size() == marker_.size())
    matched_ = std::equal(window_.begin(), window_.end(), marker_.begin());
  return matched_;
}

} // namespace lsbkit
