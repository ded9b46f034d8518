#pragma once

#include "camera.hpp"
#include "face_encoder.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/opencv.hpp>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

// Returns frames (or errors) on demand and counts calls.
class FakeCamera : public CaptureSource {
public:
  CaptureResult capture() override {
    calls++;
    CaptureResult result;
    if (error != CaptureError::NONE) {
      result.error = error;
      result.detail = "fake camera failure";
      return result;
    }
    result.frame = frame.clone();
    return result;
  }

  cv::Mat frame;
  CaptureError error = CaptureError::NONE;
  int calls = 0;
};

// "Detects" a face when pixel (0,0) is not black. The encoding is the
// pixel's three channel values in the order the image carries them.
class FakeEncoder : public FaceEncoder {
public:
  bool available() const override { return true; }
  ChannelOrder channelOrder() const override { return order; }

  EncodeResult encode(const cv::Mat &image) override {
    encode_calls++;
    EncodeResult result;
    if (image.empty() || image.channels() != 3) {
      result.error = "bad image";
      return result;
    }
    cv::Vec3b px = image.at<cv::Vec3b>(0, 0);
    if (px[0] == 0 && px[1] == 0 && px[2] == 0)
      return result;
    result.encodings.push_back({static_cast<float>(px[0]),
                                static_cast<float>(px[1]),
                                static_cast<float>(px[2])});
    return result;
  }

  float similarity(const FaceEncoding &a,
                   const FaceEncoding &b) const override {
    return cosine_similarity(a, b);
  }
  bool matches(const FaceEncoding &a, const FaceEncoding &b) const override {
    return similarity(a, b) >= 0.99f;
  }

  ChannelOrder order = ChannelOrder::BGR;
  int encode_calls = 0;
};

// Uniform BGR image
inline cv::Mat solidImage(unsigned char b, unsigned char g, unsigned char r,
                          int width = 64, int height = 48) {
  return cv::Mat(height, width, CV_8UC3, cv::Scalar(b, g, r));
}

// Fresh per-test scratch directory, removed on teardown.
class TempDirTest : public ::testing::Test {
protected:
  void SetUp() override {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    root = fs::temp_directory_path() /
           ("gatecam_" + std::string(info->test_suite_name()) + "_" +
            info->name() + "_" + std::to_string(getpid()));
    fs::remove_all(root);
    fs::create_directories(root);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  void writeImage(const fs::path &path, const cv::Mat &image) {
    fs::create_directories(path.parent_path());
    ASSERT_TRUE(cv::imwrite(path.string(), image)) << path;
  }

  void writeText(const fs::path &path, const std::string &content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
  }

  fs::path root;
};
