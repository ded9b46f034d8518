#include "face_encoder.hpp"

#include "constants.hpp"
#include "logger.hpp"

#include <cmath>
#include <filesystem>

namespace fs = std::filesystem;

float cosine_similarity(const FaceEncoding &a, const FaceEncoding &b) {
  if (a.size() != b.size() || a.empty())
    return 0.0f;

  float dot = 0.0f, norm_a = 0.0f, norm_b = 0.0f;
  for (size_t i = 0; i < a.size(); i++) {
    dot += a[i] * b[i];
    norm_a += a[i] * a[i];
    norm_b += b[i] * b[i];
  }

  float denom = std::sqrt(norm_a) * std::sqrt(norm_b);
  if (denom == 0.0f)
    return 0.0f;
  return dot / denom;
}

cv::Mat toEncoderInput(const cv::Mat &bgr, const FaceEncoder &encoder) {
  if (encoder.channelOrder() == ChannelOrder::RGB && bgr.channels() == 3) {
    cv::Mat rgb;
    cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
    return rgb;
  }
  return bgr;
}

SFaceEncoder::SFaceEncoder(cv::Ptr<cv::FaceDetectorYN> detector,
                           cv::Ptr<cv::FaceRecognizerSF> recognizer,
                           float match_threshold)
    : detector(std::move(detector)), recognizer(std::move(recognizer)),
      match_threshold_(match_threshold) {}

EncodeResult SFaceEncoder::encode(const cv::Mat &image) {
  EncodeResult result;
  if (image.empty()) {
    result.error = "Empty image";
    return result;
  }
  if (image.channels() != 3) {
    result.error = "Expected a 3-channel image, got " +
                   std::to_string(image.channels()) + " channels";
    return result;
  }

  try {
    cv::Mat faces;
    detector->setInputSize(image.size());
    detector->detect(image, faces);

    for (int i = 0; i < faces.rows; i++) {
      cv::Mat aligned, feature;
      recognizer->alignCrop(image, faces.row(i), aligned);
      recognizer->feature(aligned, feature);

      FaceEncoding enc;
      feature.reshape(1, 1).copyTo(enc);
      result.encodings.push_back(std::move(enc));
    }
  } catch (const cv::Exception &e) {
    result.encodings.clear();
    result.error = "Encoding failed: " + e.err;
  }
  return result;
}

float SFaceEncoder::similarity(const FaceEncoding &a,
                               const FaceEncoding &b) const {
  return cosine_similarity(a, b);
}

bool SFaceEncoder::matches(const FaceEncoding &a,
                           const FaceEncoding &b) const {
  return similarity(a, b) >= match_threshold_;
}

std::unique_ptr<FaceEncoder> makeFaceEncoder(const Config &config) {
  if (!config.recognition_enabled) {
    Logger::log(LogLevel::INFO, "Face recognition disabled in config.");
    return std::make_unique<UnavailableEncoder>("disabled in configuration");
  }

  std::string detection_model_path =
      config.models_dir + "/" + gatecam::DETECTION_MODEL;
  std::string recognition_model_path =
      config.models_dir + "/" + gatecam::RECOGNITION_MODEL;

  for (const auto &path : {detection_model_path, recognition_model_path}) {
    if (!fs::exists(path)) {
      Logger::log(LogLevel::WARN, "Model not found: " + path +
                                      ". Face recognition unavailable.");
      return std::make_unique<UnavailableEncoder>("model not found: " + path);
    }
  }

  try {
    Logger::log(LogLevel::INFO, "Loading Detector: " + detection_model_path);
    Logger::log(LogLevel::INFO,
                "Loading Recognizer: " + recognition_model_path);

    auto detector = cv::FaceDetectorYN::create(
        detection_model_path, "", cv::Size(320, 320),
        config.detection_threshold, 0.3f, 5000, cv::dnn::DNN_BACKEND_OPENCV,
        cv::dnn::DNN_TARGET_CPU);
    auto recognizer = cv::FaceRecognizerSF::create(
        recognition_model_path, "", cv::dnn::DNN_BACKEND_OPENCV,
        cv::dnn::DNN_TARGET_CPU);

    return std::make_unique<SFaceEncoder>(detector, recognizer,
                                          config.match_threshold);
  } catch (const cv::Exception &e) {
    Logger::log(LogLevel::ERROR,
                "Error loading models: " + std::string(e.what()));
    return std::make_unique<UnavailableEncoder>("model failed to load");
  }
}
