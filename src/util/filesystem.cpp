#include "noted/util/filesystem.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace noted::util {

// AtomicFileWriter implementation
AtomicFileWriter::AtomicFileWriter(const std::filesystem::path& target_path)
    : target_path_(target_path), written_(false), committed_(false), cancelled_(false) {
  // Generate unique temporary filename in the target's directory
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(100000, 999999);

  temp_path_ = target_path_;
  temp_path_ += ".tmp." + std::to_string(dis(gen));
}

AtomicFileWriter::~AtomicFileWriter() {
  if (!committed_ && !cancelled_) {
    cleanup();
  }
}

Result<void> AtomicFileWriter::write(std::string_view content) {
  if (committed_ || cancelled_) {
    return makeErrorResult<void>(ErrorCode::kIoError, "Writer already used");
  }

  std::ofstream file(temp_path_, std::ios::binary | std::ios::trunc);
  if (!file) {
    return makeErrorResult<void>(ErrorCode::kIoError,
                                 "Cannot create temporary file: " + temp_path_.string());
  }

  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!file) {
    file.close();
    cleanup();
    return makeErrorResult<void>(ErrorCode::kIoError,
                                 "Failed to write to temporary file: " + temp_path_.string());
  }

  file.close();
  if (!file) {
    cleanup();
    return makeErrorResult<void>(ErrorCode::kIoError,
                                 "Failed to close temporary file: " + temp_path_.string());
  }

  written_ = true;
  return {};
}

Result<void> AtomicFileWriter::commit() {
  if (committed_) {
    return makeErrorResult<void>(ErrorCode::kIoError, "Already committed");
  }
  if (cancelled_) {
    return makeErrorResult<void>(ErrorCode::kIoError, "Operation cancelled");
  }
  if (!written_) {
    return makeErrorResult<void>(ErrorCode::kIoError, "Nothing written");
  }

  auto synced = FileSystem::syncFile(temp_path_);
  if (!synced.has_value()) {
    cleanup();
    return synced;
  }

  // Same-directory rename; never falls back to copy
  std::error_code ec;
  std::filesystem::rename(temp_path_, target_path_, ec);
  if (ec) {
    cleanup();
    return makeErrorResult<void>(ErrorCode::kIoError,
                                 "Atomic rename to " + target_path_.string() +
                                     " failed: " + ec.message());
  }
  committed_ = true;

  // Sync parent directory so the rename itself is durable. The new content
  // is already in place, so a failure here is not reported.
  auto parent = target_path_.parent_path();
  if (!parent.empty()) {
    int dir_fd = ::open(parent.c_str(), O_RDONLY);
    if (dir_fd >= 0) {
      ::fsync(dir_fd);
      ::close(dir_fd);
    }
  }

  return {};
}

void AtomicFileWriter::cancel() {
  if (!committed_) {
    cancelled_ = true;
    cleanup();
  }
}

void AtomicFileWriter::cleanup() {
  std::error_code ec;
  std::filesystem::remove(temp_path_, ec);
}

// FileSystem implementation
Result<void> FileSystem::writeFileAtomic(const std::filesystem::path& path,
                                         std::string_view content) {
  AtomicFileWriter writer(path);

  auto write_result = writer.write(content);
  if (!write_result.has_value()) {
    return write_result;
  }

  return writer.commit();
}

Result<std::string> FileSystem::readFile(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return makeErrorResult<std::string>(ErrorCode::kIoError,
                                        "Not a readable file: " + path.string());
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return makeErrorResult<std::string>(ErrorCode::kIoError,
                                        "Cannot open file: " + path.string());
  }

  file.seekg(0, std::ios::end);
  auto size = file.tellg();
  if (size < 0) {
    return makeErrorResult<std::string>(ErrorCode::kIoError,
                                        "Cannot get file size: " + path.string());
  }

  file.seekg(0, std::ios::beg);

  std::string content(static_cast<std::size_t>(size), '\0');
  file.read(content.data(), size);

  if (!file) {
    return makeErrorResult<std::string>(ErrorCode::kIoError, "Read failed: " + path.string());
  }

  return content;
}

Result<void> FileSystem::copyFile(const std::filesystem::path& from,
                                  const std::filesystem::path& to) {
  std::error_code ec;
  std::filesystem::copy_file(from, to,
                             std::filesystem::copy_options::overwrite_existing, ec);

  if (ec) {
    return makeErrorResult<void>(ErrorCode::kIoError, "Copy failed: " + ec.message());
  }

  return {};
}

Result<void> FileSystem::createDirectories(const std::filesystem::path& path,
                                           std::filesystem::perms perms) {
  std::error_code ec;

  if (!std::filesystem::create_directories(path, ec) && ec) {
    return makeErrorResult<void>(ErrorCode::kIoError,
                                 "Cannot create directories: " + ec.message());
  }

  std::filesystem::permissions(path, perms, ec);
  if (ec) {
    return makeErrorResult<void>(ErrorCode::kIoError,
                                 "Cannot set directory permissions: " + ec.message());
  }

  return {};
}

bool FileSystem::exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec) && !ec;
}

Result<void> FileSystem::syncFile(const std::filesystem::path& path) {
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    return makeErrorResult<void>(ErrorCode::kIoError,
                                 "Cannot open for sync: " + path.string() + ": " +
                                     std::strerror(errno));
  }

  int rc = ::fsync(fd);
  int saved_errno = errno;
  ::close(fd);
  if (rc < 0) {
    return makeErrorResult<void>(ErrorCode::kIoError,
                                 "Sync failed: " + path.string() + ": " +
                                     std::strerror(saved_errno));
  }
  return {};
}

}  // namespace noted::util
