#include "noted/persist/document.hpp"

#include <cmath>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace noted::persist {

namespace {

constexpr const char* kFormatKey = "format";
constexpr const char* kPayloadKey = "payload";

// nlohmann::json writes NaN and infinities as null; refuse instead
bool containsNonFinite(const nlohmann::json& value) {
  switch (value.type()) {
    case nlohmann::json::value_t::number_float:
      return !std::isfinite(value.get<double>());
    case nlohmann::json::value_t::array:
    case nlohmann::json::value_t::object:
      for (const auto& item : value) {
        if (containsNonFinite(item)) return true;
      }
      return false;
    default:
      return false;
  }
}

// Builds the DOM from SAX events like nlohmann's own DOM parser, but stops
// once nesting passes kMaxNestingDepth. The binary readers recurse per
// level, so the limit also bounds their stack use.
class BoundedDomBuilder : public nlohmann::json_sax<nlohmann::json> {
 public:
  explicit BoundedDomBuilder(nlohmann::json& root) : root_(root) {}

  bool null() override { return addValue(nullptr) != nullptr; }
  bool boolean(bool val) override { return addValue(val) != nullptr; }
  bool number_integer(number_integer_t val) override { return addValue(val) != nullptr; }
  bool number_unsigned(number_unsigned_t val) override { return addValue(val) != nullptr; }
  bool number_float(number_float_t val, const string_t& /*s*/) override {
    return addValue(val) != nullptr;
  }
  bool string(string_t& val) override { return addValue(std::move(val)) != nullptr; }
  bool binary(binary_t& val) override {
    return addValue(std::move(val)) != nullptr;
  }

  bool start_object(std::size_t /*elements*/) override {
    return open(nlohmann::json::value_t::object);
  }
  bool key(string_t& val) override {
    member_ = &(*stack_.back())[val];
    return true;
  }
  bool end_object() override {
    stack_.pop_back();
    return true;
  }

  bool start_array(std::size_t /*elements*/) override {
    return open(nlohmann::json::value_t::array);
  }
  bool end_array() override {
    stack_.pop_back();
    return true;
  }

  bool parse_error(std::size_t /*position*/, const std::string& /*last_token*/,
                   const nlohmann::json::exception& ex) override {
    error_ = ex.what();
    return false;
  }

  const std::string& error() const { return error_; }

 private:
  bool open(nlohmann::json::value_t type) {
    if (stack_.size() >= kMaxNestingDepth) {
      error_ = "nesting deeper than " + std::to_string(kMaxNestingDepth) + " levels";
      return false;
    }
    auto* container = addValue(nlohmann::json(type));
    if (container == nullptr) return false;
    stack_.push_back(container);
    return true;
  }

  nlohmann::json* addValue(nlohmann::json value) {
    if (stack_.empty()) {
      root_ = std::move(value);
      return &root_;
    }
    if (stack_.back()->is_array()) {
      stack_.back()->push_back(std::move(value));
      return &stack_.back()->back();
    }
    if (member_ == nullptr) return nullptr;
    *member_ = std::move(value);
    return std::exchange(member_, nullptr);
  }

  nlohmann::json& root_;
  std::vector<nlohmann::json*> stack_;
  nlohmann::json* member_ = nullptr;
  std::string error_;
};

nlohmann::json::input_format_t inputFormat(Format format) {
  switch (format) {
    case Format::kMessagePack:
      return nlohmann::json::input_format_t::msgpack;
    case Format::kCbor:
      return nlohmann::json::input_format_t::cbor;
    case Format::kJson:
      break;
  }
  return nlohmann::json::input_format_t::json;
}

std::string toString(const std::vector<std::uint8_t>& bytes) {
  return std::string(bytes.begin(), bytes.end());
}

}  // namespace

Result<Document> encodeDocument(const nlohmann::json& value, Format format) {
  nlohmann::json envelope;
  envelope[kFormatKey] = std::string(formatName(format));
  envelope[kPayloadKey] = value;

  try {
    switch (format) {
      case Format::kJson:
        if (containsNonFinite(value)) {
          return makeErrorResult<Document>(ErrorCode::kEncodeError,
                                           "JSON cannot represent NaN or infinite numbers");
        }
        return Document{format, envelope.dump(2) + "\n"};
      case Format::kMessagePack:
        return Document{format, toString(nlohmann::json::to_msgpack(envelope))};
      case Format::kCbor:
        return Document{format, toString(nlohmann::json::to_cbor(envelope))};
    }
  } catch (const nlohmann::json::exception& e) {
    return makeErrorResult<Document>(ErrorCode::kEncodeError,
                                     std::string(formatName(format)) + " encoding failed: " +
                                         e.what());
  }

  return makeErrorResult<Document>(ErrorCode::kEncodeError, "Unsupported format");
}

Result<nlohmann::json> decodeDocument(const Document& document) {
  const auto& bytes = document.bytes;
  const auto name = std::string(formatName(document.format));

  nlohmann::json envelope;
  BoundedDomBuilder builder(envelope);
  try {
    if (!nlohmann::json::sax_parse(bytes, &builder, inputFormat(document.format), true)) {
      return makeErrorResult<nlohmann::json>(ErrorCode::kDecodeError,
                                             "Not valid " + name + ": " + builder.error());
    }
  } catch (const nlohmann::json::exception& e) {
    return makeErrorResult<nlohmann::json>(ErrorCode::kDecodeError,
                                           "Not valid " + name + ": " + e.what());
  }

  if (!envelope.is_object() || envelope.size() != 2 || !envelope.contains(kPayloadKey)) {
    return makeErrorResult<nlohmann::json>(ErrorCode::kDecodeError,
                                           "Missing snapshot envelope in " + name + " data");
  }

  auto tag = envelope.find(kFormatKey);
  if (tag == envelope.end() || !tag->is_string() || tag->get<std::string>() != name) {
    return makeErrorResult<nlohmann::json>(ErrorCode::kDecodeError,
                                           "Snapshot envelope is not tagged as " + name);
  }

  return std::move(envelope[kPayloadKey]);
}

}  // namespace noted::persist
