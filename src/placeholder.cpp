#include "placeholder.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <vector>

#include "jpeg_encoder.hpp"

namespace {
// Minimal 1x1 white JPEG (valid).
const unsigned char kTinyJpeg[] = {
    0xFF, 0xD8, 0xFF, 0xDB, 0x00, 0x43, 0x00, 0x03, 0x02, 0x02, 0x03, 0x02,
    0x02, 0x03, 0x03, 0x03, 0x03, 0x04, 0x03, 0x03, 0x04, 0x05, 0x08, 0x05,
    0x05, 0x04, 0x04, 0x05, 0x0A, 0x07, 0x07, 0x06, 0x08, 0x0C, 0x0A, 0x0C,
    0x0C, 0x0B, 0x0A, 0x0B, 0x0B, 0x0D, 0x0E, 0x12, 0x10, 0x0D, 0x0E, 0x11,
    0x0E, 0x0B, 0x0B, 0x10, 0x16, 0x10, 0x11, 0x13, 0x14, 0x15, 0x15, 0x15,
    0x0C, 0x0F, 0x17, 0x18, 0x16, 0x14, 0x18, 0x12, 0x14, 0x15, 0x14, 0xFF,
    0xC0, 0x00, 0x11, 0x08, 0x00, 0x01, 0x00, 0x01, 0x03, 0x01, 0x11, 0x00,
    0x02, 0x11, 0x01, 0x03, 0x11, 0x01, 0xFF, 0xC4, 0x00, 0x14, 0x00, 0x01,
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00, 0xFF, 0xC4, 0x00, 0x14, 0x10, 0x01, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0xFF, 0xDA, 0x00, 0x0C, 0x03, 0x01, 0x00, 0x02, 0x11, 0x03,
    0x11, 0x00, 0x3F, 0x00, 0xFF, 0xD9};

constexpr int kGlyphWidth = 5;
constexpr int kGlyphHeight = 7;
constexpr int kGlyphAdvance = kGlyphWidth + 1;

// 5x7 glyphs, one byte per column, bit 0 is the top row.
struct Glyph {
  char ch;
  uint8_t cols[kGlyphWidth];
};

const Glyph kGlyphs[] = {
    {' ', {0x00, 0x00, 0x00, 0x00, 0x00}},
    {'-', {0x08, 0x08, 0x08, 0x08, 0x08}},
    {'.', {0x00, 0x60, 0x60, 0x00, 0x00}},
    {':', {0x00, 0x36, 0x36, 0x00, 0x00}},
    {'0', {0x3E, 0x51, 0x49, 0x45, 0x3E}},
    {'1', {0x00, 0x42, 0x7F, 0x40, 0x00}},
    {'2', {0x42, 0x61, 0x51, 0x49, 0x46}},
    {'3', {0x21, 0x41, 0x45, 0x4B, 0x31}},
    {'4', {0x18, 0x14, 0x12, 0x7F, 0x10}},
    {'5', {0x27, 0x45, 0x45, 0x45, 0x39}},
    {'6', {0x3C, 0x4A, 0x49, 0x49, 0x30}},
    {'7', {0x01, 0x71, 0x09, 0x05, 0x03}},
    {'8', {0x36, 0x49, 0x49, 0x49, 0x36}},
    {'9', {0x06, 0x49, 0x49, 0x29, 0x1E}},
    {'A', {0x7C, 0x12, 0x11, 0x12, 0x7C}},
    {'B', {0x7F, 0x49, 0x49, 0x49, 0x36}},
    {'C', {0x3E, 0x41, 0x41, 0x41, 0x22}},
    {'D', {0x7F, 0x41, 0x41, 0x22, 0x1C}},
    {'E', {0x7F, 0x49, 0x49, 0x49, 0x41}},
    {'F', {0x7F, 0x09, 0x09, 0x09, 0x01}},
    {'G', {0x3E, 0x41, 0x49, 0x49, 0x7A}},
    {'H', {0x7F, 0x08, 0x08, 0x08, 0x7F}},
    {'I', {0x00, 0x41, 0x7F, 0x41, 0x00}},
    {'J', {0x20, 0x40, 0x41, 0x3F, 0x01}},
    {'K', {0x7F, 0x08, 0x14, 0x22, 0x41}},
    {'L', {0x7F, 0x40, 0x40, 0x40, 0x40}},
    {'M', {0x7F, 0x02, 0x0C, 0x02, 0x7F}},
    {'N', {0x7F, 0x04, 0x08, 0x10, 0x7F}},
    {'O', {0x3E, 0x41, 0x41, 0x41, 0x3E}},
    {'P', {0x7F, 0x09, 0x09, 0x09, 0x06}},
    {'Q', {0x3E, 0x41, 0x51, 0x21, 0x5E}},
    {'R', {0x7F, 0x09, 0x19, 0x29, 0x46}},
    {'S', {0x46, 0x49, 0x49, 0x49, 0x31}},
    {'T', {0x01, 0x01, 0x7F, 0x01, 0x01}},
    {'U', {0x3F, 0x40, 0x40, 0x40, 0x3F}},
    {'V', {0x1F, 0x20, 0x40, 0x20, 0x1F}},
    {'W', {0x3F, 0x40, 0x38, 0x40, 0x3F}},
    {'X', {0x63, 0x14, 0x08, 0x14, 0x63}},
    {'Y', {0x07, 0x08, 0x70, 0x08, 0x07}},
    {'Z', {0x61, 0x51, 0x49, 0x45, 0x43}},
};

const Glyph *find_glyph(char c) {
  const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  for (const auto &g : kGlyphs) {
    if (g.ch == upper)
      return &g;
  }
  return nullptr;
}

struct Canvas {
  int width;
  int height;
  std::vector<uint8_t> rgb;

  void fill(uint8_t r, uint8_t g, uint8_t b) {
    for (size_t i = 0; i + 2 < rgb.size(); i += 3) {
      rgb[i] = r;
      rgb[i + 1] = g;
      rgb[i + 2] = b;
    }
  }

  void block(int x0, int y0, int size, uint8_t value) {
    for (int y = std::max(0, y0); y < std::min(height, y0 + size); ++y) {
      uint8_t *row = rgb.data() + static_cast<size_t>(y) * width * 3;
      for (int x = std::max(0, x0); x < std::min(width, x0 + size); ++x) {
        row[3 * x] = row[3 * x + 1] = row[3 * x + 2] = value;
      }
    }
  }

  void text(const std::string &s, int x, int y, int scale, uint8_t value) {
    for (char c : s) {
      if (const Glyph *g = find_glyph(c)) {
        for (int col = 0; col < kGlyphWidth; ++col) {
          for (int bit = 0; bit < kGlyphHeight; ++bit) {
            if (g->cols[col] & (1u << bit))
              block(x + col * scale, y + bit * scale, scale, value);
          }
        }
      }
      x += kGlyphAdvance * scale;
    }
  }
};
} // namespace

PlaceholderRenderer::PlaceholderRenderer(int width, int height, int quality)
    : width_(std::max(16, width)), height_(std::max(16, height)),
      quality_(std::clamp(quality, 1, 100)) {}

int PlaceholderRenderer::quality_for_capture(int capture_quality) {
  return std::max(1, capture_quality / 2);
}

const char *PlaceholderRenderer::message(OfflineReason reason) {
  switch (reason) {
  case OfflineReason::CapabilityMissing:
    return "Camera Lib Missing";
  case OfflineReason::DeviceOffline:
    return "Camera Offline";
  }
  return "Camera Offline";
}

std::string PlaceholderRenderer::fallback_jpeg() {
  return std::string(reinterpret_cast<const char *>(kTinyJpeg),
                     sizeof(kTinyJpeg));
}

std::shared_ptr<const std::string>
PlaceholderRenderer::image(OfflineReason reason) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = cache_.find(reason);
  if (it != cache_.end())
    return it->second;
  auto img = std::make_shared<const std::string>(render(reason));
  cache_[reason] = img;
  return img;
}

std::string PlaceholderRenderer::render(OfflineReason reason) const {
  const std::string msg = message(reason);
  Canvas canvas{width_, height_,
                std::vector<uint8_t>(static_cast<size_t>(width_) * height_ * 3)};
  canvas.fill(20, 20, 20);

  const int text_cols = static_cast<int>(msg.size()) * kGlyphAdvance;
  int scale = std::max(1, (width_ - 40) / std::max(1, text_cols));
  scale = std::min(scale, std::max(1, width_ / 160));
  const int text_w = text_cols * scale;
  const int x = std::max(0, (width_ - text_w) / 2);
  const int y = std::max(0, (height_ - kGlyphHeight * scale) / 2);
  canvas.text(msg, x, y, scale, 220);

  std::string out;
  std::string error;
  if (!encode_rgb24_jpeg(canvas.rgb.data(), width_, height_, quality_, out,
                         error, msg)) {
    std::cerr << "[Stream] Placeholder encode failed (" << error
              << "); serving built-in frame\n";
    return fallback_jpeg();
  }
  return out;
}
