#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace detail {
inline uint8_t clamp_u8(int v) {
  return static_cast<uint8_t>(std::clamp(v, 0, 255));
}

// BT.601 limited-range YCbCr to RGB, fixed point.
inline void ycbcr_to_rgb(int y, int u, int v, uint8_t *rgb) {
  const int c = y - 16;
  const int d = u - 128;
  const int e = v - 128;
  rgb[0] = clamp_u8((298 * c + 409 * e + 128) >> 8);
  rgb[1] = clamp_u8((298 * c - 100 * d - 208 * e + 128) >> 8);
  rgb[2] = clamp_u8((298 * c + 516 * d + 128) >> 8);
}
} // namespace detail

// Convert a single YUYV 4:2:2 frame to packed RGB24.
// Assumes width is even. `src_stride` is the source row pitch in bytes
// (0 for width * 2). `dst` must hold width * height * 3 bytes.
inline void yuyv_to_rgb24(const uint8_t *src, int width, int height,
                          uint8_t *dst, int src_stride = 0) {
  const size_t pitch =
      static_cast<size_t>(src_stride > 0 ? src_stride : width * 2);
  for (int y = 0; y < height; ++y) {
    const uint8_t *row = src + y * pitch;
    uint8_t *out = dst + static_cast<size_t>(y) * width * 3;
    for (int x = 0; x < width; x += 2) {
      const int y0 = row[2 * x + 0];
      const int u = row[2 * x + 1];
      const int y1 = row[2 * x + 2];
      const int v = row[2 * x + 3];
      detail::ycbcr_to_rgb(y0, u, v, out + 3 * x);
      detail::ycbcr_to_rgb(y1, u, v, out + 3 * (x + 1));
    }
  }
}
