#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "noted/common.hpp"
#include "noted/persist/format.hpp"

namespace noted::persist {

// Encoded bytes together with the format that produced them.
//
// Every format wraps the value as {"format": <name>, "payload": <value>}, so
// bytes handed to the wrong decoder are rejected either by the parser or by
// the tag check instead of decoding into a different value.
struct Document {
  Format format;
  std::string bytes;
};

// Deepest array/object nesting accepted on decode, envelope included.
inline constexpr std::size_t kMaxNestingDepth = 512;

// Encode a value in memory. kEncodeError when the format cannot represent
// it (non-finite numbers or invalid UTF-8 in JSON).
Result<Document> encodeDocument(const nlohmann::json& value, Format format);

// Decode and unwrap. kDecodeError for malformed bytes, nesting deeper than
// kMaxNestingDepth or a tag mismatch.
Result<nlohmann::json> decodeDocument(const Document& document);

}  // namespace noted::persist
