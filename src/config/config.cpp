#include "noted/config/config.hpp"

#include <sstream>

#include <toml++/toml.hpp>

#include "noted/util/filesystem.hpp"
#include "noted/util/xdg.hpp"

namespace noted::config {

Config::Config() {
  data_dir = noted::util::Xdg::dataHome();
  snapshot_file = noted::util::Xdg::snapshotFile().filename();
  snapshot_format = persist::Format::kMessagePack;
  logging.file = noted::util::Xdg::logFile();
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  if (!std::filesystem::exists(config_path)) {
    return makeErrorResult<void>(ErrorCode::kConfigError,
                                 "Config file not found: " + config_path.string());
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    // Parse into a copy so a bad value leaves this config untouched
    Config loaded = *this;

    if (auto value = config_data["data_dir"].value<std::string>()) {
      loaded.data_dir = *value;
    }
    if (auto value = config_data["snapshot_file"].value<std::string>()) {
      loaded.snapshot_file = *value;
    }
    if (auto value = config_data["snapshot_format"].value<std::string>()) {
      auto format = persist::formatFromName(*value);
      if (!format.has_value()) {
        return makeErrorResult<void>(ErrorCode::kConfigError, format.error().message());
      }
      loaded.snapshot_format = *format;
    }

    if (auto logging_table = config_data["logging"].as_table()) {
      if (auto value = (*logging_table)["level"].value<std::string>()) {
        loaded.logging.level = *value;
      }
      if (auto value = (*logging_table)["file"].value<std::string>()) {
        loaded.logging.file = *value;
      }
      if (auto value = (*logging_table)["max_file_size"].value<int64_t>()) {
        if (*value <= 0) {
          return makeErrorResult<void>(ErrorCode::kConfigError,
                                       "logging.max_file_size must be positive");
        }
        loaded.logging.max_file_size = static_cast<std::size_t>(*value);
      }
      if (auto value = (*logging_table)["max_files"].value<int64_t>()) {
        if (*value <= 0) {
          return makeErrorResult<void>(ErrorCode::kConfigError,
                                       "logging.max_files must be positive");
        }
        loaded.logging.max_files = static_cast<std::size_t>(*value);
      }
    }

    auto valid = loaded.validate();
    if (!valid.has_value()) {
      return valid;
    }

    *this = std::move(loaded);
    config_path_ = config_path;
    return {};

  } catch (const toml::parse_error& e) {
    return makeErrorResult<void>(ErrorCode::kConfigError,
                                 "TOML parse error: " + std::string(e.what()));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  toml::table config_data;
  config_data.insert_or_assign("data_dir", data_dir.string());
  config_data.insert_or_assign("snapshot_file", snapshot_file.string());
  config_data.insert_or_assign("snapshot_format", std::string(persist::formatName(snapshot_format)));

  auto logging_table = toml::table{};
  logging_table.insert_or_assign("level", logging.level);
  if (!logging.file.empty()) logging_table.insert_or_assign("file", logging.file.string());
  logging_table.insert_or_assign("max_file_size", static_cast<int64_t>(logging.max_file_size));
  logging_table.insert_or_assign("max_files", static_cast<int64_t>(logging.max_files));
  config_data.insert_or_assign("logging", logging_table);

  std::ostringstream oss;
  oss << config_data << "\n";

  auto parent = save_path.parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent)) {
    auto created = noted::util::FileSystem::createDirectories(parent);
    if (!created.has_value()) {
      return makeErrorResult<void>(ErrorCode::kConfigError, created.error().message());
    }
  }

  auto written = noted::util::FileSystem::writeFileAtomic(save_path, oss.str());
  if (!written.has_value()) {
    return makeErrorResult<void>(ErrorCode::kConfigError,
                                 "Cannot write config: " + written.error().message());
  }
  return {};
}

Result<void> Config::validate() const {
  if (data_dir.empty()) {
    return makeErrorResult<void>(ErrorCode::kConfigError, "data_dir must not be empty");
  }
  if (snapshot_file.empty()) {
    return makeErrorResult<void>(ErrorCode::kConfigError, "snapshot_file must not be empty");
  }
  if (!noted::util::Logger::isValidLevel(logging.level)) {
    return makeErrorResult<void>(ErrorCode::kConfigError,
                                 "Unknown log level: " + logging.level);
  }
  if (logging.max_file_size == 0) {
    return makeErrorResult<void>(ErrorCode::kConfigError,
                                 "logging.max_file_size must be positive");
  }
  if (logging.max_files == 0) {
    return makeErrorResult<void>(ErrorCode::kConfigError, "logging.max_files must be positive");
  }
  return {};
}

std::filesystem::path Config::snapshotPath() const {
  if (snapshot_file.is_absolute()) {
    return snapshot_file;
  }
  return data_dir / snapshot_file;
}

std::filesystem::path Config::defaultConfigPath() {
  return noted::util::Xdg::configFile();
}

}  // namespace noted::config
