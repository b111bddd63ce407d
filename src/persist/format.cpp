#include "noted/persist/format.hpp"

#include <string>

namespace noted::persist {

std::string_view formatName(Format format) {
  switch (format) {
    case Format::kJson:
      return "json";
    case Format::kMessagePack:
      return "msgpack";
    case Format::kCbor:
      return "cbor";
  }
  return "unknown";
}

Result<Format> formatFromName(std::string_view name) {
  if (name == "json") return Format::kJson;
  if (name == "msgpack") return Format::kMessagePack;
  if (name == "cbor") return Format::kCbor;
  return makeErrorResult<Format>(ErrorCode::kInvalidArgument,
                                 "Unknown format name: " + std::string(name));
}

std::string_view formatExtension(Format format) {
  switch (format) {
    case Format::kJson:
      return ".json";
    case Format::kMessagePack:
      return ".msgpack";
    case Format::kCbor:
      return ".cbor";
  }
  return "";
}

Result<Format> formatFromExtension(const std::filesystem::path& path) {
  auto ext = path.extension().string();
  if (ext == ".json") return Format::kJson;
  if (ext == ".msgpack" || ext == ".mpk") return Format::kMessagePack;
  if (ext == ".cbor") return Format::kCbor;
  return makeErrorResult<Format>(ErrorCode::kUnknownFormatExtension,
                                 "No format registered for extension '" + ext +
                                     "' of " + path.string());
}

bool isBinaryFormat(Format format) {
  return format != Format::kJson;
}

}  // namespace noted::persist
