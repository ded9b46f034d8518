#pragma once

// Shared constants for GateCam
namespace gatecam {
constexpr const char *SOCKET_PATH = "/run/gatecam/socket";
constexpr const char *CONFIG_PATH = "/etc/gatecam/config.ini";
constexpr const char *MODELS_DIR = "/etc/gatecam/models";
constexpr const char *PHOTOS_DIR = "photos";
constexpr const char *FACES_DIR = "faces";
constexpr const char *CAMERA_DEVICE = "/dev/video0";

constexpr const char *DEFAULT_SECRET = "monSecret";
constexpr const char *SECRET_ENV = "CAPTURE_PASSWORD";

constexpr const char *DETECTION_MODEL = "face_detection_yunet_2022mar.onnx";
constexpr const char *RECOGNITION_MODEL = "face_recognition_sface_2021dec.onnx";
} // namespace gatecam
