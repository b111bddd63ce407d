#include "noted/core/tiny_id.hpp"

#include <algorithm>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace noted::core {

namespace {

// Digits without 0/1, upper case without I/O, lower case s-z.
// Kept in ASCII order so that string order follows byte order.
constexpr char kAlphabet[] = "23456789ABCDEFGHJKLMNPQRstuvwxyz";
constexpr std::size_t kAlphabetSize = sizeof(kAlphabet) - 1;
static_assert(kAlphabetSize == (1u << TinyId::kBitsPerChar));

constexpr std::size_t kPayloadBits = TinyId::kByteCount * 8;
constexpr std::size_t kPaddingBits = TinyId::kEncodedLength * TinyId::kBitsPerChar - kPayloadBits;
static_assert(kPayloadBits + kPaddingBits <= 64);

constexpr std::uint64_t kCharMask = kAlphabetSize - 1;
constexpr std::uint64_t kPaddingMask = (std::uint64_t{1} << kPaddingBits) - 1;

// Symbol value of an alphabet character, -1 for anything else
int decodeChar(char c) {
  static const std::array<int, 256> table = [] {
    std::array<int, 256> t{};
    t.fill(-1);
    for (std::size_t i = 0; i < kAlphabetSize; ++i) {
      t[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int>(i);
    }
    return t;
  }();
  return table[static_cast<unsigned char>(c)];
}

std::uint64_t packBytes(const TinyId::Bytes& bytes) {
  std::uint64_t value = 0;
  for (auto b : bytes) {
    value = (value << 8) | b;
  }
  return value;
}

}  // namespace

std::string_view TinyId::alphabet() noexcept {
  return std::string_view(kAlphabet, kAlphabetSize);
}

Result<TinyId> TinyId::fromString(std::string_view str) {
  if (str.length() != kEncodedLength) {
    return makeErrorResult<TinyId>(
        ErrorCode::kInvalidIdFormat,
        "Expected " + std::to_string(kEncodedLength) + " characters, got " +
            std::to_string(str.length()));
  }

  std::uint64_t value = 0;
  for (char c : str) {
    int symbol = decodeChar(c);
    if (symbol < 0) {
      return makeErrorResult<TinyId>(ErrorCode::kInvalidIdFormat,
                                     "Invalid character in id: " + std::string(str));
    }
    value = (value << kBitsPerChar) | static_cast<std::uint64_t>(symbol);
  }

  // The last character only has room for one payload bit
  if ((value & kPaddingMask) != 0) {
    return makeErrorResult<TinyId>(ErrorCode::kInvalidIdFormat,
                                   "Non-canonical trailing character in id: " + std::string(str));
  }
  value >>= kPaddingBits;

  Bytes bytes{};
  for (std::size_t i = kByteCount; i-- > 0;) {
    bytes[i] = static_cast<std::uint8_t>(value & 0xFF);
    value >>= 8;
  }
  return TinyId(bytes);
}

Result<TinyId> TinyId::fromBytes(std::span<const std::uint8_t> bytes) {
  if (bytes.size() != kByteCount) {
    return makeErrorResult<TinyId>(
        ErrorCode::kInvalidIdFormat,
        "Expected " + std::to_string(kByteCount) + " bytes, got " + std::to_string(bytes.size()));
  }

  Bytes data{};
  std::copy(bytes.begin(), bytes.end(), data.begin());
  return TinyId(data);
}

std::string TinyId::toString() const {
  std::uint64_t value = packBytes(bytes_) << kPaddingBits;

  std::string result(kEncodedLength, kAlphabet[0]);
  for (std::size_t i = kEncodedLength; i-- > 0;) {
    result[i] = kAlphabet[value & kCharMask];
    value >>= kBitsPerChar;
  }
  return result;
}

bool TinyId::isNull() const noexcept {
  return std::all_of(bytes_.begin(), bytes_.end(), [](std::uint8_t b) { return b == 0; });
}

bool TinyId::operator==(const TinyId& other) const noexcept {
  return bytes_ == other.bytes_;
}

bool TinyId::operator!=(const TinyId& other) const noexcept {
  return !(*this == other);
}

bool TinyId::operator<(const TinyId& other) const noexcept {
  return compare(*this, other) < 0;
}

bool TinyId::operator<=(const TinyId& other) const noexcept {
  return compare(*this, other) <= 0;
}

bool TinyId::operator>(const TinyId& other) const noexcept {
  return compare(*this, other) > 0;
}

bool TinyId::operator>=(const TinyId& other) const noexcept {
  return compare(*this, other) >= 0;
}

std::size_t TinyId::Hash::operator()(const TinyId& id) const noexcept {
  return std::hash<std::uint64_t>{}(packBytes(id.bytes_));
}

std::strong_ordering compare(const TinyId& a, const TinyId& b) noexcept {
  return std::lexicographical_compare_three_way(a.bytes().begin(), a.bytes().end(),
                                                b.bytes().begin(), b.bytes().end());
}

std::ostream& operator<<(std::ostream& os, const TinyId& id) {
  return os << id.toString();
}

void to_json(nlohmann::json& j, const TinyId& id) {
  j = id.toString();
}

void from_json(const nlohmann::json& j, TinyId& id) {
  auto parsed = TinyId::fromString(j.get<std::string>());
  if (!parsed.has_value()) {
    throw std::invalid_argument(parsed.error().message());
  }
  id = *parsed;
}

}  // namespace noted::core
