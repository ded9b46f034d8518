#pragma once

#include "config.hpp"

#include <memory>
#include <opencv2/dnn.hpp>
#include <opencv2/objdetect.hpp>
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

using FaceEncoding = std::vector<float>;

enum class ChannelOrder { BGR, RGB };

// Cosine similarity between two encodings. Returns 0 for empty, mismatched
// or zero-norm inputs.
float cosine_similarity(const FaceEncoding &a, const FaceEncoding &b);

struct EncodeResult {
  std::vector<FaceEncoding> encodings; // One per detected face
  std::string error;                   // Empty on success

  bool ok() const { return error.empty(); }
};

// Face encoding capability. A deployment without the models gets an
// UnavailableEncoder instead of checks at every call site.
class FaceEncoder {
public:
  virtual ~FaceEncoder() = default;

  virtual bool available() const = 0;
  // Why available() is false. Empty when available.
  virtual std::string unavailableReason() const { return ""; }
  virtual ChannelOrder channelOrder() const { return ChannelOrder::BGR; }

  [[nodiscard]] virtual EncodeResult encode(const cv::Mat &image) = 0;
  virtual float similarity(const FaceEncoding &a,
                           const FaceEncoding &b) const = 0;
  virtual bool matches(const FaceEncoding &a, const FaceEncoding &b) const = 0;
};

class UnavailableEncoder : public FaceEncoder {
public:
  explicit UnavailableEncoder(std::string reason)
      : reason_(std::move(reason)) {}

  bool available() const override { return false; }
  std::string unavailableReason() const override { return reason_; }

  EncodeResult encode(const cv::Mat &) override {
    EncodeResult result;
    result.error = "Face recognition unavailable: " + reason_;
    return result;
  }
  float similarity(const FaceEncoding &, const FaceEncoding &) const override {
    return 0.0f;
  }
  bool matches(const FaceEncoding &, const FaceEncoding &) const override {
    return false;
  }

private:
  std::string reason_;
};

// YuNet detection + SFace features. Two encodings match when their cosine
// similarity reaches match_threshold.
class SFaceEncoder : public FaceEncoder {
public:
  SFaceEncoder(cv::Ptr<cv::FaceDetectorYN> detector,
               cv::Ptr<cv::FaceRecognizerSF> recognizer,
               float match_threshold);

  bool available() const override { return true; }

  EncodeResult encode(const cv::Mat &image) override;
  float similarity(const FaceEncoding &a,
                   const FaceEncoding &b) const override;
  bool matches(const FaceEncoding &a, const FaceEncoding &b) const override;

private:
  cv::Ptr<cv::FaceDetectorYN> detector;
  cv::Ptr<cv::FaceRecognizerSF> recognizer;
  float match_threshold_;
};

// Converts a BGR image (camera frame or decoded file) to the channel order
// the encoder expects. Conversion goes to a fresh buffer; the input is never
// modified.
cv::Mat toEncoderInput(const cv::Mat &bgr, const FaceEncoder &encoder);

// Loads the models named in the config. Returns an UnavailableEncoder when
// recognition is disabled or the models cannot be loaded.
std::unique_ptr<FaceEncoder> makeFaceEncoder(const Config &config);
