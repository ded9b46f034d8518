#pragma once

#include "face_encoder.hpp"
#include "gallery.hpp"

#include <opencv2/opencv.hpp>
#include <string>

enum class MatchStatus { MATCHED, NO_FACE, NO_MATCH, ENCODE_FAILED };

struct MatchResult {
  MatchStatus status = MatchStatus::NO_MATCH;
  std::string label; // Set when MATCHED
  float score = 0.0f;
  std::string error; // Set when ENCODE_FAILED

  bool matched() const { return status == MatchStatus::MATCHED; }
};

class FaceMatcher {
public:
  explicit FaceMatcher(FaceEncoder &encoder) : encoder(encoder) {}

  // Encodes the first face of a BGR probe frame and returns the FIRST gallery
  // entry (in gallery order) that matches it, not the closest one.
  [[nodiscard]] MatchResult match(const cv::Mat &probe_frame,
                                  const Gallery &gallery);

private:
  FaceEncoder &encoder;
};
