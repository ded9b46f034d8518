#include "protocol.hpp"

#include "logger.hpp"

#include <cerrno>
#include <unistd.h>

using json = nlohmann::json;

std::string versionString() {
#ifdef GATECAM_VERSION
  return GATECAM_VERSION;
#else
  return "Unknown";
#endif
}

ReadStatus readRequest(int fd, std::string &request, size_t max_bytes) {
  request.clear();
  char buffer[1024];
  while (true) {
    ssize_t n = read(fd, buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return ReadStatus::CLOSED;
    }
    if (n == 0)
      break;
    request.append(buffer, static_cast<size_t>(n));

    size_t newline = request.find('\n');
    if (newline != std::string::npos) {
      request.resize(newline + 1);
      break;
    }
    if (request.size() > max_bytes)
      break;
  }

  if (request.size() > max_bytes) {
    request.clear();
    return ReadStatus::TOO_LONG;
  }
  return request.empty() ? ReadStatus::CLOSED : ReadStatus::OK;
}

std::string errorResponse(const std::string &message) {
  json j;
  j["status"] = "error";
  j["message"] = message;
  return j.dump();
}

json outcomeToJson(const Outcome &outcome) {
  json j;
  j["status"] = outcome.secret_accepted ? "ok" : "error";
  j["outcome"] = outcomeName(outcome.kind);
  j["message"] = renderMessage(outcome);
  j["photo_path"] =
      outcome.photo_path.empty() ? json(nullptr) : json(outcome.photo_path);
  j["person"] = outcome.label.empty() ? json(nullptr) : json(outcome.label);
  return j;
}

std::string handleRequest(const std::string &request,
                          VerificationEngine &engine) {
  std::string line = request;
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
    line.pop_back();

  std::string cmd = line.substr(0, line.find(' '));
  // Everything after the first space, spaces included
  std::string arg =
      line.find(' ') == std::string::npos ? "" : line.substr(cmd.size() + 1);

  Logger::log(LogLevel::DEBUG, "Received Request: " + cmd);

  json response;
  try {
    if (cmd == "SUBMIT") {
      Outcome outcome = engine.evaluate(arg);
      response = outcomeToJson(outcome);
    } else if (cmd == "STATUS") {
      EngineStatus st = engine.status();
      response["status"] = "ok";
      response["recognition"] = st.recognition_available;
      response["reason"] = st.unavailable_reason;
      response["gallery_size"] = st.gallery_size;
    } else if (cmd == "GET_VERSION") {
      return versionString();
    } else {
      return errorResponse("Unknown command");
    }
  } catch (const std::exception &e) {
    Logger::log(LogLevel::ERROR, "Exception handling " + cmd + ": " + e.what());
    return errorResponse("Internal error");
  }
  return response.dump();
}
