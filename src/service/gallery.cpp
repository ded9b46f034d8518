#include "gallery.hpp"

#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <opencv2/imgcodecs.hpp>

namespace fs = std::filesystem;

bool GalleryLoader::isGalleryImage(const std::string &filename) {
  std::string ext = fs::path(filename).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext == ".jpg" || ext == ".jpeg" || ext == ".png";
}

Gallery GalleryLoader::load(const std::string &directory) {
  Gallery gallery;
  if (!encoder.available())
    return gallery;

  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    Logger::log(LogLevel::DEBUG,
                "Gallery directory " + directory + " does not exist");
    return gallery;
  }

  std::vector<fs::path> candidates;
  for (fs::directory_iterator it(directory, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec))
      continue;
    std::string name = it->path().filename().string();
    if (isGalleryImage(name))
      candidates.push_back(it->path());
  }
  if (ec) {
    Logger::log(LogLevel::WARN,
                "Gallery scan of " + directory + " stopped: " + ec.message());
  }

  // Sort for consistent ordering across filesystems
  std::sort(candidates.begin(), candidates.end(),
            [](const fs::path &a, const fs::path &b) {
              return a.filename().string() < b.filename().string();
            });

  for (const auto &path : candidates) {
    cv::Mat image;
    try {
      image = cv::imread(path.string(), cv::IMREAD_COLOR);
    } catch (const cv::Exception &e) {
      Logger::log(LogLevel::WARN,
                  "Gallery: cannot decode " + path.string() + ": " + e.err);
      continue;
    }
    if (image.empty()) {
      Logger::log(LogLevel::WARN,
                  "Gallery: unreadable image " + path.string());
      continue;
    }

    // Same channel order as the probe side
    EncodeResult enc = encoder.encode(toEncoderInput(image, encoder));
    if (!enc.ok()) {
      Logger::log(LogLevel::WARN,
                  "Gallery: " + path.string() + ": " + enc.error);
      continue;
    }
    if (enc.encodings.empty()) {
      Logger::log(LogLevel::DEBUG,
                  "Gallery: no face detected in " + path.string());
      continue;
    }

    GalleryEntry entry;
    entry.label = path.stem().string();
    entry.encoding = std::move(enc.encodings.front());
    entry.source_path = path.string();
    gallery.push_back(std::move(entry));
  }

  Logger::log(LogLevel::DEBUG, "Gallery: loaded " +
                                   std::to_string(gallery.size()) +
                                   " reference face(s) from " + directory);
  return gallery;
}
