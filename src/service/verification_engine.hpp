#pragma once

#include "camera.hpp"
#include "config.hpp"
#include "face_encoder.hpp"
#include "gallery.hpp"
#include "intrusion_recorder.hpp"
#include "outcome.hpp"

#include <string>

constexpr const char *RECOGNITION_UNAVAILABLE_REASON =
    "Face recognition is not available on this system";

struct EngineStatus {
  bool recognition_available = false;
  std::string unavailable_reason;
  size_t gallery_size = 0;
};

// Turns a submitted secret into exactly one Outcome. A wrong secret always
// leads to an intruder photo and never to recognition.
class VerificationEngine {
public:
  VerificationEngine(const Config &config, CaptureSource &camera,
                     FaceEncoder &encoder);

  [[nodiscard]] Outcome evaluate(const std::string &submitted_secret);

  // Capability flag and current gallery size. Never touches the camera.
  [[nodiscard]] EngineStatus status();
  [[nodiscard]] Gallery loadGallery();

private:
  const Config &config;
  CaptureSource &camera;
  FaceEncoder &encoder;
  IntrusionRecorder recorder;

  Outcome handleWrongSecret();
  Outcome recognize();
};
