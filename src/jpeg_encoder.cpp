#include "jpeg_encoder.hpp"

#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <vector>

#include <jpeglib.h>

#include "yuv_convert.hpp"

namespace {
// libjpeg's default error_exit calls exit(); jump back instead.
struct JpegErrorManager {
  jpeg_error_mgr pub;
  std::jmp_buf jump;
  char message[JMSG_LENGTH_MAX];
};

void on_jpeg_error(j_common_ptr cinfo) {
  auto *err = reinterpret_cast<JpegErrorManager *>(cinfo->err);
  (*cinfo->err->format_message)(cinfo, err->message);
  std::longjmp(err->jump, 1);
}

void on_jpeg_message(j_common_ptr, int) {}

// Only trivially destructible locals live in this frame because of setjmp.
bool compress(const uint8_t *rgb, int width, int height, int quality,
              const std::string &comment, unsigned char **buf,
              unsigned long *size, char *message) {
  jpeg_compress_struct cinfo;
  JpegErrorManager jerr;
  cinfo.err = jpeg_std_error(&jerr.pub);
  jerr.pub.error_exit = on_jpeg_error;
  jerr.pub.emit_message = on_jpeg_message;
  jerr.message[0] = '\0';
  if (setjmp(jerr.jump)) {
    jpeg_destroy_compress(&cinfo);
    std::snprintf(message, JMSG_LENGTH_MAX, "%s", jerr.message);
    return false;
  }

  jpeg_create_compress(&cinfo);
  jpeg_mem_dest(&cinfo, buf, size);
  cinfo.image_width = static_cast<JDIMENSION>(width);
  cinfo.image_height = static_cast<JDIMENSION>(height);
  cinfo.input_components = 3;
  cinfo.in_color_space = JCS_RGB;
  jpeg_set_defaults(&cinfo);
  jpeg_set_quality(&cinfo, quality, TRUE);
  jpeg_start_compress(&cinfo, TRUE);
  if (!comment.empty()) {
    jpeg_write_marker(&cinfo, JPEG_COM,
                      reinterpret_cast<const JOCTET *>(comment.data()),
                      static_cast<unsigned int>(comment.size()));
  }
  const int stride = width * 3;
  JSAMPROW row[1];
  while (cinfo.next_scanline < cinfo.image_height) {
    row[0] = const_cast<JSAMPROW>(rgb + cinfo.next_scanline * stride);
    jpeg_write_scanlines(&cinfo, row, 1);
  }
  jpeg_finish_compress(&cinfo);
  jpeg_destroy_compress(&cinfo);
  return true;
}
} // namespace

bool encode_rgb24_jpeg(const uint8_t *rgb, int width, int height, int quality,
                       std::string &out, std::string &error,
                       const std::string &comment) {
  if (!rgb || width <= 0 || height <= 0) {
    error = "invalid image dimensions";
    return false;
  }
  if (quality < 1)
    quality = 1;
  if (quality > 100)
    quality = 100;

  unsigned char *buf = nullptr;
  unsigned long size = 0;
  char message[JMSG_LENGTH_MAX] = {0};
  const bool ok =
      compress(rgb, width, height, quality, comment, &buf, &size, message);
  if (ok)
    out.assign(reinterpret_cast<const char *>(buf), size);
  else
    error = std::string("libjpeg: ") + message;
  std::free(buf);
  return ok;
}

bool encode_yuyv_jpeg(const uint8_t *yuyv, int width, int height, int quality,
                      std::string &out, std::string &error, int stride) {
  if (!yuyv || width <= 0 || height <= 0 || (width % 2) != 0) {
    error = "invalid YUYV frame dimensions";
    return false;
  }
  if (stride != 0 && stride < width * 2) {
    error = "YUYV row pitch shorter than the row";
    return false;
  }
  std::vector<uint8_t> rgb(static_cast<size_t>(width) * height * 3);
  yuyv_to_rgb24(yuyv, width, height, rgb.data(), stride);
  return encode_rgb24_jpeg(rgb.data(), width, height, quality, out, error);
}

bool looks_like_jpeg(const std::string &data) {
  return data.size() >= 4 && static_cast<unsigned char>(data[0]) == 0xFF &&
         static_cast<unsigned char>(data[1]) == 0xD8 &&
         static_cast<unsigned char>(data[data.size() - 2]) == 0xFF &&
         static_cast<unsigned char>(data[data.size() - 1]) == 0xD9;
}
