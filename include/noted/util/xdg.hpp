#pragma once

#include <filesystem>
#include <string>

namespace noted::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // Get XDG data home directory (~/.local/share/noted)
  static std::filesystem::path dataHome();

  // Get XDG config home directory (~/.config/noted)
  static std::filesystem::path configHome();

  // Get XDG state home directory (~/.local/state/noted)
  static std::filesystem::path stateHome();

  // Get config file path
  static std::filesystem::path configFile();

  // Get default snapshot path
  static std::filesystem::path snapshotFile();

  // Get default log file path
  static std::filesystem::path logFile();

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace noted::util
