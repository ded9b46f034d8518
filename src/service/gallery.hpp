#pragma once

#include "face_encoder.hpp"

#include <string>
#include <vector>

struct GalleryEntry {
  std::string label; // Filename stem, not unique
  FaceEncoding encoding;
  std::string source_path;
};

using Gallery = std::vector<GalleryEntry>;

// Builds the reference gallery from a directory of face images.
class GalleryLoader {
public:
  explicit GalleryLoader(FaceEncoder &encoder) : encoder(encoder) {}

  // Files are visited in ascending filename order and the result keeps that
  // order. Unreadable images and images without a face are skipped; a
  // missing directory or an unavailable encoder yields an empty gallery.
  [[nodiscard]] Gallery load(const std::string &directory);

  static bool isGalleryImage(const std::string &filename);

private:
  FaceEncoder &encoder;
};
