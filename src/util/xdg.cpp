#include "noted/util/xdg.hpp"

#include <cstdlib>

namespace noted::util {

std::filesystem::path Xdg::dataHome() {
  std::string xdg_data_home = getEnvVar("XDG_DATA_HOME", "");
  if (!xdg_data_home.empty()) {
    return std::filesystem::path(xdg_data_home) / "noted";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".noted_data";
  }

  return std::filesystem::path(home) / ".local" / "share" / "noted";
}

std::filesystem::path Xdg::configHome() {
  std::string xdg_config_home = getEnvVar("XDG_CONFIG_HOME", "");
  if (!xdg_config_home.empty()) {
    return std::filesystem::path(xdg_config_home) / "noted";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".noted_config";
  }

  return std::filesystem::path(home) / ".config" / "noted";
}

std::filesystem::path Xdg::stateHome() {
  std::string xdg_state_home = getEnvVar("XDG_STATE_HOME", "");
  if (!xdg_state_home.empty()) {
    return std::filesystem::path(xdg_state_home) / "noted";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".noted_state";
  }

  return std::filesystem::path(home) / ".local" / "state" / "noted";
}

std::filesystem::path Xdg::configFile() {
  return configHome() / "config.toml";
}

std::filesystem::path Xdg::snapshotFile() {
  return dataHome() / "notes.msgpack";
}

std::filesystem::path Xdg::logFile() {
  return stateHome() / "noted.log";
}

std::string Xdg::getEnvVar(const std::string& name, const std::string& default_value) {
  const char* value = std::getenv(name.c_str());
  return value ? std::string(value) : default_value;
}

}  // namespace noted::util
