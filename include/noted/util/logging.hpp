#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "noted/common.hpp"

namespace noted::util {

struct LogOptions {
  std::string level = "warn";     // trace, debug, info, warn, error, critical, off
  std::filesystem::path file;     // empty = console only
  std::size_t max_file_size = 1024 * 1024 * 5;
  std::size_t max_files = 3;
};

// Installs the process-wide spdlog logger used by the library
class Logger {
 public:
  static Logger& instance();

  // Console sink at warn and above, plus a rotating file sink when
  // options.file is set. Safe to call again to reconfigure.
  Result<void> initialize(const LogOptions& options);

  bool initialized() const { return initialized_; }

  static bool isValidLevel(const std::string& level);

 private:
  Logger() = default;

  bool initialized_ = false;
};

}  // namespace noted::util
