#include "camera.hpp"
#include "config.hpp"
#include "constants.hpp"
#include "face_encoder.hpp"
#include "logger.hpp"
#include "protocol.hpp"
#include "verification_engine.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace fs = std::filesystem;

// Global shutdown flag
std::atomic<bool> g_running(true);

void signal_handler(int) { g_running = false; }

void handle_client(int client_fd, VerificationEngine &engine) {
  // A silent client must not block the service forever
  struct timeval tv;
  tv.tv_sec = 5;
  tv.tv_usec = 0;
  setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, (const char *)&tv, sizeof tv);

  std::string request;
  ReadStatus status = readRequest(client_fd, request);
  if (status == ReadStatus::CLOSED) {
    close(client_fd);
    return;
  }

  std::string response;
  if (status == ReadStatus::TOO_LONG) {
    Logger::log(LogLevel::WARN, "Rejected request over " +
                                    std::to_string(MAX_REQUEST_BYTES) +
                                    " bytes");
    response = errorResponse("Request too long");
  } else {
    response = handleRequest(request, engine);
  }

  if (send(client_fd, response.c_str(), response.length(), MSG_NOSIGNAL) < 0) {
    Logger::log(LogLevel::WARN,
                "Failed to send response: " + std::string(strerror(errno)));
  }
  close(client_fd);
}

int main(int argc, char *argv[]) {
  signal(SIGINT, signal_handler);
  signal(SIGTERM, signal_handler);

  std::string config_path = defaultConfigPath();
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--version" || arg == "-v") {
      std::cout << versionString() << std::endl;
      return 0;
    }
  }

  const Config config = loadConfig(config_path);
  Logger::setLevel(logLevelFromString(config.log_level));
  Logger::setLogFile(config.log_file);

  Logger::log(LogLevel::INFO, "Starting GateCam Service...");
  Logger::log(LogLevel::INFO, "Loading Config: " + config_path);

  std::unique_ptr<FaceEncoder> encoder = makeFaceEncoder(config);
  Camera camera(config.camera_device, config.warmup_frames);
  VerificationEngine engine(config, camera, *encoder);

  // Create directory for socket if needed
  std::string socket_path = config.socket_path;
  fs::path p(socket_path);
  if (p.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);
    if (ec) {
      Logger::log(LogLevel::ERROR, "Cannot create " +
                                       p.parent_path().string() + ": " +
                                       ec.message());
      return 1;
    }
  }

  // Socket Setup
  int server_fd = socket(AF_UNIX, SOCK_STREAM, 0);
  if (server_fd < 0) {
    perror("socket failed");
    return 1;
  }

  struct sockaddr_un address;
  memset(&address, 0, sizeof(address));
  address.sun_family = AF_UNIX;
  strncpy(address.sun_path, socket_path.c_str(), sizeof(address.sun_path) - 1);

  unlink(socket_path.c_str()); // Remove old socket
  if (bind(server_fd, (struct sockaddr *)&address, sizeof(address)) < 0) {
    perror("bind failed");
    close(server_fd);
    return 1;
  }

  // Any local user may submit a secret
  chmod(socket_path.c_str(), 0666);

  if (listen(server_fd, 5) < 0) {
    perror("listen");
    close(server_fd);
    return 1;
  }

  Logger::log(LogLevel::INFO, "Listening on " + socket_path);

  while (g_running) {
    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(server_fd, &readfds);

    // Timeout for select to allow checking g_running
    struct timeval timeout;
    timeout.tv_sec = 1;
    timeout.tv_usec = 0;

    int activity = select(server_fd + 1, &readfds, NULL, NULL, &timeout);
    if (activity < 0 && errno != EINTR) {
      Logger::log(LogLevel::ERROR,
                  "select failed: " + std::string(strerror(errno)));
      break;
    }

    if (g_running && activity > 0 && FD_ISSET(server_fd, &readfds)) {
      int client_fd = accept(server_fd, NULL, NULL);
      if (client_fd >= 0) {
        // Blocking: the camera is single-access anyway
        handle_client(client_fd, engine);
      }
    }
  }

  close(server_fd);
  unlink(socket_path.c_str());
  Logger::log(LogLevel::INFO, "Stopped.");
  return 0;
}
