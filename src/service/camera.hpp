#pragma once

#include <mutex>
#include <opencv2/opencv.hpp>
#include <string>

enum class CaptureError { NONE, DEVICE_UNAVAILABLE, READ_FAILED };

struct CaptureResult {
  cv::Mat frame; // BGR, empty unless error == NONE
  CaptureError error = CaptureError::NONE;
  std::string detail;

  bool ok() const { return error == CaptureError::NONE; }
};

// Blocking source of single still frames.
class CaptureSource {
public:
  virtual ~CaptureSource() = default;
  [[nodiscard]] virtual CaptureResult capture() = 0;
};

class Camera : public CaptureSource {
public:
  explicit Camera(const std::string &device_path, int warmup_frames = 5);

  // Opens the device, reads one frame and releases the device before
  // returning. Only one capture runs at a time in the process.
  [[nodiscard]] CaptureResult capture() override;

  const std::string &devicePath() const { return device_path; }

private:
  std::string device_path;
  int device_id = 0;
  bool use_index = true;
  int warmup_frames_ = 5;

  bool open(cv::VideoCapture &cap);

  static inline std::mutex device_mutex_;
};
