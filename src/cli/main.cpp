#include "camera.hpp"
#include "config.hpp"
#include "face_encoder.hpp"
#include "logger.hpp"
#include "outcome.hpp"
#include "protocol.hpp"
#include "verification_engine.hpp"

#include <cstring>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <termios.h>
#include <unistd.h>

using json = nlohmann::json;

// Reads one line from stdin with terminal echo disabled. Returns false when
// nothing could be read.
bool read_secret(const std::string &prompt, std::string &secret) {
  std::cerr << prompt << std::flush;

  struct termios old_attrs;
  bool is_tty =
      isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &old_attrs) == 0;
  if (is_tty) {
    struct termios silent = old_attrs;
    silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent);
  }

  bool ok = static_cast<bool>(std::getline(std::cin, secret));

  if (is_tty) {
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &old_attrs);
    std::cerr << std::endl;
  }
  return ok;
}

std::string send_cmd(const std::string &socket_path, const std::string &cmd) {
  int sock = socket(AF_UNIX, SOCK_STREAM, 0);
  if (sock < 0) {
    std::cerr << "Error creating socket." << std::endl;
    return "";
  }

  struct sockaddr_un addr;
  memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

  if (connect(sock, (struct sockaddr *)&addr, sizeof(addr)) == -1) {
    std::cerr << "Could not connect to service at " << socket_path
              << ". Is gatecamd running?" << std::endl;
    close(sock);
    return "";
  }

  std::string line = cmd + "\n";
  if (send(sock, line.c_str(), line.length(), 0) < 0) {
    std::cerr << "Error sending request." << std::endl;
    close(sock);
    return "";
  }

  std::string response;
  char buffer[4096];
  ssize_t bytes_read;
  while ((bytes_read = read(sock, buffer, sizeof(buffer))) > 0) {
    response.append(buffer, static_cast<size_t>(bytes_read));
  }
  close(sock);
  return response;
}

void print_outcome(const Outcome &outcome) {
  std::cout << renderMessage(outcome) << std::endl;
}

void print_help() {
  std::cout << "GateCam CLI Tool v" << versionString() << "\n"
            << "Usage:\n"
            << "  gatecam [check]            Ask for the secret and verify it\n"
            << "  gatecam remote             Same, through the gatecamd "
               "service\n"
            << "  gatecam gallery            Show recognition status and "
               "reference faces\n"
            << "  gatecam version            Show version\n"
            << "  gatecam help               Show this help\n"
            << "Options:\n"
            << "  --config <path>            Use another config file\n";
}

int run_check(const Config &config) {
  std::string secret;
  if (!read_secret("Secret: ", secret)) {
    std::cout << "Unable to read the secret." << std::endl;
    return 1;
  }

  std::unique_ptr<FaceEncoder> encoder = makeFaceEncoder(config);
  Camera camera(config.camera_device, config.warmup_frames);
  VerificationEngine engine(config, camera, *encoder);

  Outcome outcome = engine.evaluate(secret);
  print_outcome(outcome);
  return exitCode(outcome);
}

int run_remote(const Config &config) {
  std::string secret;
  if (!read_secret("Secret: ", secret)) {
    std::cout << "Unable to read the secret." << std::endl;
    return 1;
  }

  std::string resp = send_cmd(config.socket_path, "SUBMIT " + secret);
  if (resp.empty()) {
    std::cerr << "Error: Connection closed by service (empty response)."
              << std::endl;
    return 1;
  }

  try {
    json j = json::parse(resp);
    std::cout << j.value("message", std::string("(no message)")) << std::endl;
    return j.value("status", std::string("error")) == "ok" ? 0 : 1;
  } catch (const json::exception &e) {
    std::cerr << "Malformed response from service: " << e.what() << std::endl;
    return 1;
  }
}

int run_gallery(const Config &config) {
  std::unique_ptr<FaceEncoder> encoder = makeFaceEncoder(config);
  if (!encoder->available()) {
    std::cout << "Face recognition: unavailable ("
              << encoder->unavailableReason() << ")" << std::endl;
    return 0;
  }
  std::cout << "Face recognition: available" << std::endl;

  GalleryLoader loader(*encoder);
  Gallery gallery = loader.load(config.faces_dir);
  std::cout << "Reference faces in '" << config.faces_dir
            << "': " << gallery.size() << std::endl;
  for (const auto &entry : gallery) {
    std::cout << "  " << entry.label << "  (" << entry.source_path << ")"
              << std::endl;
  }
  return 0;
}

int main(int argc, char *argv[]) {
  std::string op = "check";
  std::string config_path = defaultConfigPath();

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) {
        std::cout << "Error: --config requires a path" << std::endl;
        return 1;
      }
      config_path = argv[++i];
    } else {
      op = arg;
    }
  }

  if (op == "help" || op == "--help" || op == "-h") {
    print_help();
    return 0;
  }
  if (op == "version" || op == "--version" || op == "-v") {
    std::cout << "Client Version: " << versionString() << std::endl;
    return 0;
  }

  // Keep stdout for the result line
  Logger::setConsoleToStderr(true);
  const Config config = loadConfig(config_path);
  Logger::setLevel(logLevelFromString(config.log_level));
  Logger::setLogFile(config.log_file);

  if (op == "check") {
    return run_check(config);
  } else if (op == "remote") {
    return run_remote(config);
  } else if (op == "gallery") {
    return run_gallery(config);
  }

  std::cout << "Unknown command. Try 'gatecam help'." << std::endl;
  return 1;
}
