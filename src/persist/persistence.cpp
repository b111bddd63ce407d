#include "noted/persist/persistence.hpp"

#include <spdlog/spdlog.h>

#include "noted/util/filesystem.hpp"

namespace noted::persist {

Result<void> Persistence::writeDocument(const Document& document,
                                        const std::filesystem::path& path) {
  auto result = util::FileSystem::writeFileAtomic(path, document.bytes);
  if (!result.has_value()) {
    spdlog::warn("Saving {} snapshot to {} failed: {}", formatName(document.format),
                 path.string(), result.error().message());
    return result;
  }

  spdlog::debug("Saved {} bytes of {} to {}", document.bytes.size(),
                formatName(document.format), path.string());
  return {};
}

Result<Document> Persistence::readDocument(const std::filesystem::path& path, Format format) {
  auto content = util::FileSystem::readFile(path);
  if (!content.has_value()) {
    spdlog::warn("Loading snapshot from {} failed: {}", path.string(),
                 content.error().message());
    return std::unexpected(content.error());
  }

  spdlog::debug("Read {} bytes from {} as {}", content->size(), path.string(),
                formatName(format));
  return Document{format, std::move(*content)};
}

Result<nlohmann::json> Persistence::decodeSnapshot(const Document& document,
                                                   const std::filesystem::path& path) {
  auto json = decodeDocument(document);
  if (!json.has_value()) {
    spdlog::warn("Decoding {} as {} failed: {}", path.string(), formatName(document.format),
                 json.error().message());
  }
  return json;
}

std::filesystem::path Persistence::backupPath(const std::filesystem::path& path) {
  auto backup = path;
  backup += ".bak";
  return backup;
}

Result<void> Persistence::ensureAbsent(const std::filesystem::path& path) {
  if (util::FileSystem::exists(path)) {
    return makeErrorResult<void>(ErrorCode::kIoError, "File already exists: " + path.string());
  }
  return {};
}

Result<void> Persistence::backupFile(const std::filesystem::path& path) {
  auto backup = backupPath(path);
  auto copied = util::FileSystem::copyFile(path, backup);
  if (!copied.has_value()) {
    return copied;
  }
  spdlog::info("Backed up {} to {}", path.string(), backup.string());
  return {};
}

}  // namespace noted::persist
