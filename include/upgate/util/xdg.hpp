#pragma once

#include <filesystem>
#include <string>

namespace upgate::util {

// XDG base directories for upgate
class Xdg {
 public:
  // ~/.local/share/upgate
  static std::filesystem::path dataHome();

  // ~/.config/upgate
  static std::filesystem::path configHome();

  static std::filesystem::path configFile();

  // Default storage root
  static std::filesystem::path storageDir();

 private:
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace upgate::util
