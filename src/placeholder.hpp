#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "types.hpp"

// Renders the "no live video" JPEG: a flat dark canvas with a message
// describing why video is unavailable. One image is rendered per reason and
// reused for every stream.
class PlaceholderRenderer {
public:
  PlaceholderRenderer(int width, int height, int quality);

  std::shared_ptr<const std::string> image(OfflineReason reason);
  int quality() const { return quality_; }

  // Half the live quality, at least 1.
  static int quality_for_capture(int capture_quality);

  static const char *message(OfflineReason reason);
  // Minimal valid JPEG served if rendering fails, so a part is never empty.
  static std::string fallback_jpeg();

private:
  std::string render(OfflineReason reason) const;

  int width_;
  int height_;
  int quality_;
  std::mutex mu_;
  std::map<OfflineReason, std::shared_ptr<const std::string>> cache_;
};
