#pragma once

#include "outcome.hpp"
#include "verification_engine.hpp"

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

constexpr size_t MAX_REQUEST_BYTES = 4096;

enum class ReadStatus { OK, TOO_LONG, CLOSED };

// Protocol: one line per connection
//   "SUBMIT <secret>"  -> outcome document
//   "STATUS"           -> capability / gallery document
//   "GET_VERSION"      -> version string
nlohmann::json outcomeToJson(const Outcome &outcome);

std::string handleRequest(const std::string &request,
                          VerificationEngine &engine);

// Reads one request line (up to '\n' or EOF) from a connected socket.
// A request longer than max_bytes is never returned in part.
ReadStatus readRequest(int fd, std::string &request,
                       size_t max_bytes = MAX_REQUEST_BYTES);

std::string errorResponse(const std::string &message);

std::string versionString();
