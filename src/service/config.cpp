#include "config.hpp"

#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

IniMap parse_ini(const std::string &path) {
  IniMap result;
  std::ifstream file(path);
  if (!file.is_open())
    return result;

  std::string line, current_section;
  while (std::getline(file, line)) {
    // Trim
    line.erase(0, line.find_first_not_of(" \t"));
    if (line.empty() || line[0] == ';' || line[0] == '#')
      continue;
    auto last = line.find_last_not_of(" \t\r");
    if (last != std::string::npos)
      line.erase(last + 1);

    if (line[0] == '[' && line.back() == ']') {
      current_section = line.substr(1, line.size() - 2);
    } else {
      size_t eq = line.find('=');
      if (eq != std::string::npos) {
        std::string key = line.substr(0, eq);
        key.erase(key.find_last_not_of(" \t") + 1);
        std::string val = line.substr(eq + 1);
        val.erase(0, val.find_first_not_of(" \t"));
        result[current_section + "." + key] = val;
      }
    }
  }
  return result;
}

namespace {

float parseFloat(const std::string &key, const std::string &value,
                 float fallback) {
  try {
    size_t used = 0;
    float v = std::stof(value, &used);
    if (used == value.size())
      return v;
  } catch (const std::exception &) {
  }
  Logger::log(LogLevel::WARN, "Config: invalid number for " + key + " ('" +
                                  value + "'), using default");
  return fallback;
}

int parseInt(const std::string &key, const std::string &value, int fallback) {
  try {
    size_t used = 0;
    int v = std::stoi(value, &used);
    if (used == value.size() && v >= 0)
      return v;
  } catch (const std::exception &) {
  }
  Logger::log(LogLevel::WARN, "Config: invalid integer for " + key + " ('" +
                                  value + "'), using default");
  return fallback;
}

// true/false, yes/no, on/off, 1/0 in any case
bool parseBool(const std::string &key, std::string value, bool fallback) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (value == "true" || value == "yes" || value == "on" || value == "1")
    return true;
  if (value == "false" || value == "no" || value == "off" || value == "0")
    return false;
  Logger::log(LogLevel::WARN, "Config: invalid boolean for " + key + " ('" +
                                  value + "'), using default");
  return fallback;
}

} // namespace

Config configFromIni(const IniMap &ini) {
  Config config;

  auto get = [&ini](const std::string &key,
                    const std::string &def) -> std::string {
    auto it = ini.find(key);
    return it != ini.end() ? it->second : def;
  };

  config.secret = get("Auth.secret", config.secret);

  config.photos_dir = get("Paths.photos_dir", config.photos_dir);
  config.faces_dir = get("Paths.faces_dir", config.faces_dir);
  config.models_dir = get("Paths.models_dir", config.models_dir);

  config.camera_device = get("Camera.device", config.camera_device);
  if (ini.count("Camera.warmup_frames"))
    config.warmup_frames = parseInt("Camera.warmup_frames",
                                    ini.at("Camera.warmup_frames"),
                                    config.warmup_frames);

  if (ini.count("Recognition.enabled"))
    config.recognition_enabled =
        parseBool("Recognition.enabled", ini.at("Recognition.enabled"),
                  config.recognition_enabled);
  if (ini.count("Recognition.match_threshold"))
    config.match_threshold = parseFloat("Recognition.match_threshold",
                                        ini.at("Recognition.match_threshold"),
                                        config.match_threshold);
  if (ini.count("Recognition.detection_threshold"))
    config.detection_threshold =
        parseFloat("Recognition.detection_threshold",
                   ini.at("Recognition.detection_threshold"),
                   config.detection_threshold);

  config.socket_path = get("Service.socket_path", config.socket_path);

  config.log_level = get("Logging.level", config.log_level);
  config.log_file = get("Logging.file", config.log_file);

  // Environment wins over the file
  const char *env_secret = std::getenv(gatecam::SECRET_ENV);
  if (env_secret) {
    config.secret = env_secret;
  }

  return config;
}

Config loadConfig(const std::string &path) {
  if (!path.empty() && !fs::exists(path)) {
    Logger::log(LogLevel::DEBUG,
                "Config file " + path + " not found, using defaults");
  }
  return configFromIni(parse_ini(path));
}

std::string defaultConfigPath() {
  std::string config_path = gatecam::CONFIG_PATH;
  // Fallback to local config for dev
  if (!fs::exists(config_path)) {
    config_path = "config.ini";
  }
  return config_path;
}
