#include "camera.hpp"

#include "logger.hpp"

#include <opencv2/core/utils/logger.hpp>

Camera::Camera(const std::string &device_path, int warmup_frames)
    : device_path(device_path), warmup_frames_(warmup_frames) {
  cv::utils::logging::setLogLevel(cv::utils::logging::LOG_LEVEL_ERROR);

  // "/dev/videoN" and "N" select a V4L2 index, a printf pattern such as
  // "frame_%02d.png" an image sequence, anything else is handed to OpenCV as
  // a filename / pipeline.
  std::string index_str = device_path;
  if (device_path.rfind("/dev/video", 0) == 0) {
    index_str = device_path.substr(10);
  }
  try {
    size_t used = 0;
    device_id = std::stoi(index_str, &used);
    use_index = (used == index_str.size());
  } catch (const std::exception &) {
    use_index = false;
  }
  if (!use_index)
    device_id = 0;
}

bool Camera::open(cv::VideoCapture &cap) {
  if (use_index)
    return cap.open(device_id, cv::CAP_V4L2) || cap.open(device_id);
  if (device_path.find('%') != std::string::npos)
    return cap.open(device_path, cv::CAP_IMAGES);
  return cap.open(device_path);
}

CaptureResult Camera::capture() {
  std::lock_guard<std::mutex> lock(device_mutex_);
  CaptureResult result;

  try {
    // Released by its destructor on every path out of this scope
    cv::VideoCapture cap;
    if (!open(cap)) {
      Logger::log(LogLevel::ERROR, "[Camera] Failed to open " + device_path);
      result.error = CaptureError::DEVICE_UNAVAILABLE;
      result.detail = "Cannot access camera " + device_path;
      return result;
    }

    cv::Mat frame;
    // Discard initial frames for auto-exposure settling
    for (int i = 0; i < warmup_frames_; i++)
      cap.read(frame);

    if (!cap.read(frame) || frame.empty()) {
      Logger::log(LogLevel::ERROR,
                  "[Camera] No frame returned by " + device_path);
      result.error = CaptureError::READ_FAILED;
      result.detail = "Failed to read a frame from camera " + device_path;
      return result;
    }

    result.frame = frame.clone();
  } catch (const cv::Exception &e) {
    Logger::log(LogLevel::ERROR,
                "[Camera] OpenCV error: " + std::string(e.what()));
    result.frame.release();
    result.error = CaptureError::READ_FAILED;
    result.detail = "Camera error: " + e.err;
    return result;
  }

  Logger::log(LogLevel::DEBUG, "[Camera] Captured " +
                                   std::to_string(result.frame.cols) + "x" +
                                   std::to_string(result.frame.rows) +
                                   " frame from " + device_path);
  return result;
}
