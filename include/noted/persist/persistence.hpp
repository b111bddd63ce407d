#pragma once

#include <exception>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "noted/common.hpp"
#include "noted/persist/document.hpp"
#include "noted/persist/format.hpp"

namespace noted::persist {

// Saves and restores values through nlohmann::json conversions (to_json /
// from_json found by ADL) in a caller-chosen format.
//
// Saves are encoded fully in memory and then written with a temp file and
// rename, so the file at `path` always holds either the previous snapshot
// or the new one. Concurrent saves to the same path must be serialized by
// the caller.
class Persistence {
 public:
  static constexpr Format kDefaultFormat = Format::kMessagePack;

  template <typename T>
  static Result<void> save(const T& value, const std::filesystem::path& path, Format format) {
    auto json = toJson(value);
    if (!json.has_value()) {
      return std::unexpected(json.error());
    }

    auto document = encodeDocument(*json, format);
    if (!document.has_value()) {
      return std::unexpected(document.error());
    }

    return writeDocument(*document, path);
  }

  template <typename T>
  static Result<T> load(const std::filesystem::path& path, Format format) {
    auto document = readDocument(path, format);
    if (!document.has_value()) {
      return std::unexpected(document.error());
    }

    auto json = decodeSnapshot(*document, path);
    if (!json.has_value()) {
      return std::unexpected(json.error());
    }

    return fromJson<T>(*json);
  }

  // Format chosen from the file extension
  template <typename T>
  static Result<void> saveAuto(const T& value, const std::filesystem::path& path) {
    auto format = formatFromExtension(path);
    if (!format.has_value()) {
      return std::unexpected(format.error());
    }
    return save(value, path, *format);
  }

  template <typename T>
  static Result<T> loadAuto(const std::filesystem::path& path) {
    auto format = formatFromExtension(path);
    if (!format.has_value()) {
      return std::unexpected(format.error());
    }
    return load<T>(path, *format);
  }

  template <typename T>
  static Result<void> saveDefault(const T& value, const std::filesystem::path& path) {
    return save(value, path, kDefaultFormat);
  }

  template <typename T>
  static Result<T> loadDefault(const std::filesystem::path& path) {
    return load<T>(path, kDefaultFormat);
  }

  // Like save(), but fails with kIoError if `path` already exists
  template <typename T>
  static Result<void> saveNew(const T& value, const std::filesystem::path& path, Format format) {
    auto absent = ensureAbsent(path);
    if (!absent.has_value()) {
      return absent;
    }
    return save(value, path, format);
  }

  // Re-encode a snapshot in place from one format to another. The original
  // bytes are copied to "<path>.bak" first.
  template <typename T>
  static Result<void> convertFile(const std::filesystem::path& path, Format from, Format to) {
    auto value = load<T>(path, from);
    if (!value.has_value()) {
      return std::unexpected(value.error());
    }

    auto backup = backupFile(path);
    if (!backup.has_value()) {
      return backup;
    }

    return save(*value, path, to);
  }

  // Atomically write an already encoded document
  static Result<void> writeDocument(const Document& document, const std::filesystem::path& path);

  // Read a file as a document of the given format, without decoding it
  static Result<Document> readDocument(const std::filesystem::path& path, Format format);

  static std::filesystem::path backupPath(const std::filesystem::path& path);

 private:
  template <typename T>
  static Result<nlohmann::json> toJson(const T& value) {
    try {
      nlohmann::json json = value;
      return json;
    } catch (const nlohmann::json::exception& e) {
      return makeErrorResult<nlohmann::json>(ErrorCode::kEncodeError, e.what());
    } catch (const std::exception& e) {
      return makeErrorResult<nlohmann::json>(ErrorCode::kEncodeError, e.what());
    }
  }

  template <typename T>
  static Result<T> fromJson(const nlohmann::json& json) {
    try {
      return json.get<T>();
    } catch (const nlohmann::json::exception& e) {
      return makeErrorResult<T>(ErrorCode::kDecodeError, e.what());
    } catch (const std::exception& e) {
      return makeErrorResult<T>(ErrorCode::kDecodeError, e.what());
    }
  }

  static Result<nlohmann::json> decodeSnapshot(const Document& document,
                                               const std::filesystem::path& path);
  static Result<void> ensureAbsent(const std::filesystem::path& path);
  static Result<void> backupFile(const std::filesystem::path& path);
};

}  // namespace noted::persist
