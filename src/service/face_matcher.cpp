#include "face_matcher.hpp"

#include "logger.hpp"

MatchResult FaceMatcher::match(const cv::Mat &probe_frame,
                               const Gallery &gallery) {
  MatchResult result;

  EncodeResult enc = encoder.encode(toEncoderInput(probe_frame, encoder));
  if (!enc.ok()) {
    result.status = MatchStatus::ENCODE_FAILED;
    result.error = enc.error;
    Logger::log(LogLevel::WARN, "Probe encoding failed: " + enc.error);
    return result;
  }
  if (enc.encodings.empty()) {
    result.status = MatchStatus::NO_FACE;
    Logger::log(LogLevel::INFO, "NO_FACE_DETECTED in probe frame.");
    return result;
  }

  const FaceEncoding &probe_enc = enc.encodings.front();
  for (const auto &entry : gallery) {
    if (encoder.matches(entry.encoding, probe_enc)) {
      result.status = MatchStatus::MATCHED;
      result.label = entry.label;
      result.score = encoder.similarity(entry.encoding, probe_enc);
      Logger::log(LogLevel::INFO, "MATCH " + entry.label + " (score: " +
                                      std::to_string(result.score) + ")");
      return result;
    }
  }

  Logger::log(LogLevel::INFO,
              "MISMATCH: none of " + std::to_string(gallery.size()) +
                  " reference face(s) matched.");
  result.status = MatchStatus::NO_MATCH;
  return result;
}
