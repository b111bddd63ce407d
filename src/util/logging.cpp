#include "noted/util/logging.hpp"

#include <array>
#include <memory>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace noted::util {

namespace {

constexpr std::array<const char*, 7> kLevelNames = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

}  // namespace

Logger& Logger::instance() {
  static Logger instance_;
  return instance_;
}

bool Logger::isValidLevel(const std::string& level) {
  for (const auto* name : kLevelNames) {
    if (level == name) return true;
  }
  return false;
}

Result<void> Logger::initialize(const LogOptions& options) {
  if (!isValidLevel(options.level)) {
    return makeErrorResult<void>(ErrorCode::kConfigError, "Unknown log level: " + options.level);
  }
  auto level = spdlog::level::from_str(options.level);

  try {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);

    std::vector<spdlog::sink_ptr> sinks = {console_sink};

    if (!options.file.empty()) {
      auto parent = options.file.parent_path();
      if (!parent.empty()) {
        std::filesystem::create_directories(parent);
      }
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          options.file.string(), options.max_file_size, options.max_files);
      sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("noted", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
  } catch (const spdlog::spdlog_ex& e) {
    return makeErrorResult<void>(ErrorCode::kIoError,
                                 "Failed to set up logging: " + std::string(e.what()));
  } catch (const std::filesystem::filesystem_error& e) {
    return makeErrorResult<void>(ErrorCode::kIoError,
                                 "Failed to create log directory: " + std::string(e.what()));
  }

  initialized_ = true;
  return {};
}

}  // namespace noted::util
