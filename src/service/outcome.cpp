#include "outcome.hpp"

const char *outcomeName(OutcomeKind kind) {
  switch (kind) {
  case OutcomeKind::SECRET_REJECTED:
    return "secret_rejected";
  case OutcomeKind::RECOGNITION_UNAVAILABLE:
    return "recognition_unavailable";
  case OutcomeKind::RECOGNITION_SKIPPED_NO_GALLERY:
    return "recognition_skipped_no_gallery";
  case OutcomeKind::PERSON_RECOGNIZED:
    return "person_recognized";
  case OutcomeKind::PERSON_UNKNOWN:
    return "person_unknown";
  case OutcomeKind::CAPTURE_FAILED:
    return "capture_failed";
  case OutcomeKind::PERSIST_FAILED:
    return "persist_failed";
  }
  return "unknown";
}

std::string renderMessage(const Outcome &outcome) {
  switch (outcome.kind) {
  case OutcomeKind::SECRET_REJECTED:
    return "Wrong secret - photo saved: " + outcome.photo_path;
  case OutcomeKind::PERSIST_FAILED:
    return "Photo capture failed: " + outcome.detail;
  case OutcomeKind::CAPTURE_FAILED:
    if (!outcome.secret_accepted)
      return "Photo capture failed: " + outcome.detail;
    return "Secret accepted. Face recognition could not run: " +
           outcome.detail;
  case OutcomeKind::RECOGNITION_UNAVAILABLE:
    return "Secret accepted. " + outcome.detail + ". Recognition skipped.";
  case OutcomeKind::RECOGNITION_SKIPPED_NO_GALLERY:
    return "Secret accepted. No reference faces found. Recognition skipped.";
  case OutcomeKind::PERSON_RECOGNIZED:
    return "Secret accepted. Welcome, " + outcome.label + "!";
  case OutcomeKind::PERSON_UNKNOWN:
    return "Secret accepted. Unknown face.";
  }
  return "Unexpected outcome";
}

int exitCode(const Outcome &outcome) {
  return outcome.secret_accepted ? 0 : 1;
}
