#include "intrusion_recorder.hpp"

#include "logger.hpp"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

std::string
IntrusionRecorder::photoFilename(std::chrono::system_clock::time_point when) {
  auto in_time_t = std::chrono::system_clock::to_time_t(when);
  std::tm local_tm{};
  localtime_r(&in_time_t, &local_tm);
  std::ostringstream oss;
  oss << "photo_" << std::put_time(&local_tm, "%Y%m%d_%H%M%S") << ".png";
  return oss.str();
}

PersistResult IntrusionRecorder::persist(const cv::Mat &frame) {
  PersistResult result;
  if (frame.empty()) {
    result.error = "Nothing to save (empty frame)";
    return result;
  }

  std::error_code ec;
  fs::create_directories(photos_dir_, ec);
  std::error_code stat_ec;
  if (ec || !fs::is_directory(photos_dir_, stat_ec)) {
    result.error = "Cannot create photo directory " + photos_dir_ + ": " +
                   (ec ? ec.message() : std::string("not a directory"));
    Logger::log(LogLevel::ERROR, result.error);
    return result;
  }

  std::string path =
      (fs::path(photos_dir_) /
       photoFilename(std::chrono::system_clock::now()))
          .string();
  try {
    if (!cv::imwrite(path, frame)) {
      result.error = "Failed to save image: " + path;
      Logger::log(LogLevel::ERROR, result.error);
      return result;
    }
  } catch (const cv::Exception &e) {
    result.error = "Failed to save image: " + path + " (" + e.err + ")";
    Logger::log(LogLevel::ERROR, result.error);
    return result;
  }

  result.ok = true;
  result.path = path;
  Logger::log(LogLevel::INFO, "Intruder photo saved: " + path);
  return result;
}
