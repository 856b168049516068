#pragma once

#include <cstdint>
#include <string>

// Compresses a packed RGB24 image with libjpeg. `comment`, when non-empty, is
// stored in a COM marker. Returns false and fills `error` if libjpeg reports a
// failure.
bool encode_rgb24_jpeg(const uint8_t *rgb, int width, int height, int quality,
                       std::string &out, std::string &error,
                       const std::string &comment = "");

// Compresses a YUYV 4:2:2 frame (width must be even). `stride` is the row
// pitch in bytes; 0 means width * 2.
bool encode_yuyv_jpeg(const uint8_t *yuyv, int width, int height, int quality,
                      std::string &out, std::string &error, int stride = 0);

// True if `data` starts with SOI and ends with EOI.
bool looks_like_jpeg(const std::string &data);
