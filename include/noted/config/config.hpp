#pragma once

#include <filesystem>
#include <string>

#include "noted/common.hpp"
#include "noted/persist/format.hpp"
#include "noted/util/logging.hpp"

namespace noted::config {

// Configuration for the note store core, read from a TOML file:
//
//   data_dir = "/home/me/.local/share/noted"
//   snapshot_file = "notes.msgpack"
//   snapshot_format = "msgpack"
//
//   [logging]
//   level = "info"
//   file = "/home/me/.local/state/noted/noted.log"
class Config {
 public:
  // Defaults from XDG directories; does not touch the filesystem
  Config();

  // Core paths
  std::filesystem::path data_dir;
  std::filesystem::path snapshot_file;

  persist::Format snapshot_format = persist::Format::kMessagePack;

  util::LogOptions logging;

  // Load from file, overriding the keys it sets
  Result<void> load(const std::filesystem::path& config_path);

  // Save to file (atomically); empty path means the file last loaded, or
  // the default location
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Validate configuration
  Result<void> validate() const;

  // snapshot_file, resolved against data_dir when relative
  std::filesystem::path snapshotPath() const;

  static std::filesystem::path defaultConfigPath();

 private:
  std::filesystem::path config_path_;
};

}  // namespace noted::config
