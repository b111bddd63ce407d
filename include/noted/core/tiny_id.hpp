#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "noted/common.hpp"

namespace noted::core {

// Short, user-typeable identifier: 7 random bytes rendered as 12 characters
// of a 32-symbol alphabet that leaves out look-alikes (0/O/o, 1/I/l/i).
class TinyId {
 public:
  static constexpr std::size_t kByteCount = 7;
  static constexpr std::size_t kBitsPerChar = 5;
  static constexpr std::size_t kEncodedLength =
      (kByteCount * 8 + kBitsPerChar - 1) / kBitsPerChar;

  using Bytes = std::array<std::uint8_t, kByteCount>;

  // The encoding alphabet, in ascending symbol value
  static std::string_view alphabet() noexcept;

  // Default constructor creates the null (all-zero) id
  TinyId() = default;

  explicit TinyId(const Bytes& bytes) noexcept : bytes_(bytes) {}

  static TinyId null() noexcept { return TinyId(); }

  // Parse the canonical text form
  static Result<TinyId> fromString(std::string_view str);

  // Build from a raw payload; the span must hold exactly kByteCount bytes
  static Result<TinyId> fromBytes(std::span<const std::uint8_t> bytes);

  // Canonical text form, always kEncodedLength characters
  std::string toString() const;

  const Bytes& bytes() const noexcept { return bytes_; }

  bool isNull() const noexcept;

  // Comparison operators (byte order)
  bool operator==(const TinyId& other) const noexcept;
  bool operator!=(const TinyId& other) const noexcept;
  bool operator<(const TinyId& other) const noexcept;
  bool operator<=(const TinyId& other) const noexcept;
  bool operator>(const TinyId& other) const noexcept;
  bool operator>=(const TinyId& other) const noexcept;

  // Hash support for containers
  struct Hash {
    std::size_t operator()(const TinyId& id) const noexcept;
  };

 private:
  Bytes bytes_{};
};

// Lexicographic comparison over the raw payload. Use this, not the string
// form, when a stable display order is needed.
std::strong_ordering compare(const TinyId& a, const TinyId& b) noexcept;

std::ostream& operator<<(std::ostream& os, const TinyId& id);

// JSON conversion uses the canonical text form
void to_json(nlohmann::json& j, const TinyId& id);
void from_json(const nlohmann::json& j, TinyId& id);

}  // namespace noted::core

// Hash specialization for std::unordered_map
namespace std {
template <>
struct hash<noted::core::TinyId> : noted::core::TinyId::Hash {};
}  // namespace std
