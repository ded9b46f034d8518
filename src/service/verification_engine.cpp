#include "verification_engine.hpp"

#include "face_matcher.hpp"
#include "logger.hpp"

VerificationEngine::VerificationEngine(const Config &config,
                                       CaptureSource &camera,
                                       FaceEncoder &encoder)
    : config(config), camera(camera), encoder(encoder),
      recorder(config.photos_dir) {}

Outcome VerificationEngine::evaluate(const std::string &submitted_secret) {
  Outcome outcome = (submitted_secret != config.secret) ? handleWrongSecret()
                                                        : recognize();
  Logger::log(LogLevel::INFO,
              std::string("Evaluation result: ") + outcomeName(outcome.kind));
  return outcome;
}

Outcome VerificationEngine::handleWrongSecret() {
  Outcome outcome;
  outcome.secret_accepted = false;
  Logger::log(LogLevel::WARN, "Wrong secret submitted. Capturing intruder.");

  CaptureResult shot = camera.capture();
  if (!shot.ok()) {
    outcome.kind = OutcomeKind::CAPTURE_FAILED;
    outcome.detail = shot.detail;
    return outcome;
  }

  PersistResult saved = recorder.persist(shot.frame);
  if (!saved.ok) {
    outcome.kind = OutcomeKind::PERSIST_FAILED;
    outcome.detail = saved.error;
    return outcome;
  }

  outcome.kind = OutcomeKind::SECRET_REJECTED;
  outcome.photo_path = saved.path;
  return outcome;
}

Outcome VerificationEngine::recognize() {
  Outcome outcome;
  outcome.secret_accepted = true;

  if (!encoder.available()) {
    Logger::log(LogLevel::INFO, "Recognition skipped: " +
                                    encoder.unavailableReason());
    outcome.kind = OutcomeKind::RECOGNITION_UNAVAILABLE;
    outcome.detail = RECOGNITION_UNAVAILABLE_REASON;
    return outcome;
  }

  Gallery gallery = loadGallery();
  if (gallery.empty()) {
    Logger::log(LogLevel::INFO, "No reference faces in " + config.faces_dir +
                                    ". Recognition skipped.");
    outcome.kind = OutcomeKind::RECOGNITION_SKIPPED_NO_GALLERY;
    return outcome;
  }

  CaptureResult shot = camera.capture();
  if (!shot.ok()) {
    outcome.kind = OutcomeKind::CAPTURE_FAILED;
    outcome.detail = shot.detail;
    return outcome;
  }

  FaceMatcher matcher(encoder);
  MatchResult match = matcher.match(shot.frame, gallery);
  if (match.matched()) {
    outcome.kind = OutcomeKind::PERSON_RECOGNIZED;
    outcome.label = match.label;
  } else {
    outcome.kind = OutcomeKind::PERSON_UNKNOWN;
  }
  return outcome;
}

Gallery VerificationEngine::loadGallery() {
  GalleryLoader loader(encoder);
  return loader.load(config.faces_dir);
}

EngineStatus VerificationEngine::status() {
  EngineStatus st;
  st.recognition_available = encoder.available();
  st.unavailable_reason = encoder.unavailableReason();
  if (st.recognition_available)
    st.gallery_size = loadGallery().size();
  return st;
}
