#include "noted/common.hpp"

#include <sstream>

namespace noted {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kInvalidIdFormat:
      return "Invalid id format";
    case ErrorCode::kExhaustedIdSpace:
      return "Exhausted id space";
    case ErrorCode::kEncodeError:
      return "Encode error";
    case ErrorCode::kDecodeError:
      return "Decode error";
    case ErrorCode::kIoError:
      return "I/O error";
    case ErrorCode::kUnknownFormatExtension:
      return "Unknown format extension";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Error::describe() const {
  std::ostringstream oss;
  oss << errorCodeToString(code_) << ": " << message_;
  return oss.str();
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  return oss.str();
}

Version getVersion() {
  return Version{NOTED_VERSION_MAJOR, NOTED_VERSION_MINOR, NOTED_VERSION_PATCH};
}

}  // namespace noted
