#include "readlater/common.hpp"

#include <sstream>

namespace readlater {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kNetworkError:
      return "Network error";
    case ErrorCode::kConfigError:
      return "Configuration error";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
#ifdef READLATER_VERSION_BUILD
  return Version{0, 1, 0, READLATER_VERSION_BUILD};
#else
  return Version{0, 1, 0, ""};
#endif
}

}  // namespace readlater
