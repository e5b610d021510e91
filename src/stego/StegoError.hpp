#pragma once

#include <string_view>

namespace lsbkit {

// Error types reported by the embedding/extraction engines and the codec
enum class StegoError {
  CapacityExceeded,
  InvalidChannel,
  InvalidImage,
  InvalidUtf8,
  InvalidConfig,
  WriteFailure,
  UnsupportedFormat
};

// String representation for StegoError
std::string_view errorToString(StegoError error) noexcept;

} // namespace lsbkit
