#include "StegoError.hpp"

namespace lsbkit {

std::string_view errorToString(StegoError error) noexcept {
  switch (error) {
  case StegoError::CapacityExceeded:
    return "Capacity exceeded";
  case StegoError::InvalidChannel:
    return "Invalid channel";
  case StegoError::InvalidImage:
    return "Invalid image";
  case StegoError::InvalidUtf8:
    return "Invalid UTF-8";
  case StegoError::InvalidConfig:
    return "Invalid configuration";
  case StegoError::WriteFailure:
    return "Write failure";
  case StegoError::UnsupportedFormat:
    return "Unsupported format";
  default:
    return "Unknown error";
  }
}

} // namespace lsbkit
