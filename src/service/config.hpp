#pragma once

#include "constants.hpp"

#include <string>
#include <unordered_map>

// Process-wide settings, built once at startup and passed by reference.
struct Config {
  std::string secret = gatecam::DEFAULT_SECRET;

  // Paths
  std::string photos_dir = gatecam::PHOTOS_DIR;
  std::string faces_dir = gatecam::FACES_DIR;
  std::string models_dir = gatecam::MODELS_DIR;

  // Camera
  std::string camera_device = gatecam::CAMERA_DEVICE;
  int warmup_frames = 5;

  // Recognition
  bool recognition_enabled = true;
  float match_threshold = 0.363f;
  float detection_threshold = 0.9f;

  // Service
  std::string socket_path = gatecam::SOCKET_PATH;

  // Logging
  std::string log_level = "info";
  std::string log_file;
};

using IniMap = std::unordered_map<std::string, std::string>;

// Flat "Section.key" -> value map. Missing file yields an empty map.
IniMap parse_ini(const std::string &path);

// Applies INI values over the defaults, then the CAPTURE_PASSWORD
// environment variable over the secret.
[[nodiscard]] Config loadConfig(const std::string &path);
[[nodiscard]] Config configFromIni(const IniMap &ini);

// Picks the system config if present, else ./config.ini.
std::string defaultConfigPath();
