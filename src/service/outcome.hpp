#pragma once

#include <string>

enum class OutcomeKind {
  SECRET_REJECTED,
  RECOGNITION_UNAVAILABLE,
  RECOGNITION_SKIPPED_NO_GALLERY,
  PERSON_RECOGNIZED,
  PERSON_UNKNOWN,
  CAPTURE_FAILED,
  PERSIST_FAILED
};

// Result of one evaluation. Which fields are set depends on kind:
// photo_path for SECRET_REJECTED, label for PERSON_RECOGNIZED, detail for
// RECOGNITION_UNAVAILABLE / CAPTURE_FAILED / PERSIST_FAILED.
struct Outcome {
  OutcomeKind kind = OutcomeKind::PERSON_UNKNOWN;
  bool secret_accepted = false;
  std::string photo_path;
  std::string label;
  std::string detail;
};

// Wire name, e.g. "secret_rejected"
const char *outcomeName(OutcomeKind kind);

// One line for a human
std::string renderMessage(const Outcome &outcome);

// CLI exit status: 1 when the secret was rejected, 0 otherwise
int exitCode(const Outcome &outcome);
