#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "noted/common.hpp"

namespace noted::util {

// Writes to a temporary file next to the target and renames it over the
// target on commit. Until commit() succeeds the target is left untouched;
// a writer destroyed without committing removes its temporary file.
class AtomicFileWriter {
 public:
  explicit AtomicFileWriter(const std::filesystem::path& target_path);
  ~AtomicFileWriter();

  // Non-copyable, non-movable
  AtomicFileWriter(const AtomicFileWriter&) = delete;
  AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;
  AtomicFileWriter(AtomicFileWriter&&) = delete;
  AtomicFileWriter& operator=(AtomicFileWriter&&) = delete;

  // Write content to temporary file
  Result<void> write(std::string_view content);

  // Commit the changes (fsync, rename temp to target, fsync directory)
  Result<void> commit();

  // Cancel the operation (removes temp file)
  void cancel();

  const std::filesystem::path& tempPath() const { return temp_path_; }

 private:
  std::filesystem::path target_path_;
  std::filesystem::path temp_path_;
  bool written_;
  bool committed_;
  bool cancelled_;

  void cleanup();
};

// Filesystem utilities
class FileSystem {
 public:
  // Atomic write with fsync and rename
  static Result<void> writeFileAtomic(const std::filesystem::path& path,
                                      std::string_view content);

  // Read the whole file
  static Result<std::string> readFile(const std::filesystem::path& path);

  // Copy file, replacing the destination
  static Result<void> copyFile(const std::filesystem::path& from,
                               const std::filesystem::path& to);

  // Create directory with proper permissions
  static Result<void> createDirectories(const std::filesystem::path& path,
                                        std::filesystem::perms perms = std::filesystem::perms::owner_all);

  static bool exists(const std::filesystem::path& path);

  // Flush a file's data to disk
  static Result<void> syncFile(const std::filesystem::path& path);
};

}  // namespace noted::util
