#pragma once

#include <chrono>
#include <opencv2/opencv.hpp>
#include <string>

struct PersistResult {
  bool ok = false;
  std::string path;  // Written file on success
  std::string error; // Set on failure
};

// Stores frames captured after a wrong secret as
// <photos_dir>/photo_<YYYYMMDD_HHMMSS>.png.
class IntrusionRecorder {
public:
  explicit IntrusionRecorder(std::string photos_dir)
      : photos_dir_(std::move(photos_dir)) {}

  [[nodiscard]] PersistResult persist(const cv::Mat &frame);

  static std::string
  photoFilename(std::chrono::system_clock::time_point when);

  const std::string &photosDir() const { return photos_dir_; }

private:
  std::string photos_dir_;
};
