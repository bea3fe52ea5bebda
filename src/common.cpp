#include "upgate/common.hpp"

#include <sstream>

namespace upgate {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kFileReadError:
      return "File read error";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kFilePermissionDenied:
      return "File permission denied";
    case ErrorCode::kDirectoryNotFound:
      return "Directory not found";
    case ErrorCode::kDirectoryCreateError:
      return "Directory create error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kRateLimited:
      return "Rate limit exceeded";
    case ErrorCode::kStorageError:
      return "Storage error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kUnknownError:
      return "Unknown error";
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
#ifdef UPGATE_VERSION_BUILD
  return Version{0, 3, 1, UPGATE_VERSION_BUILD};
#else
  return Version{0, 3, 1, ""};
#endif
}

}  // namespace upgate
