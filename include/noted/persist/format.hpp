#pragma once

#include <filesystem>
#include <string_view>

#include "noted/common.hpp"

namespace noted::persist {

// Wire encodings a snapshot can be written in
enum class Format {
  kJson,         // human-readable text
  kMessagePack,  // compact binary
  kCbor          // compact binary
};

// Stable lower-case name, also used as the envelope tag
std::string_view formatName(Format format);

// Inverse of formatName
Result<Format> formatFromName(std::string_view name);

// Preferred file extension, including the leading dot
std::string_view formatExtension(Format format);

// Fixed extension mapping: .json, .msgpack/.mpk, .cbor
Result<Format> formatFromExtension(const std::filesystem::path& path);

bool isBinaryFormat(Format format);

}  // namespace noted::persist
