#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "camera_device.hpp"
#include "types.hpp"

// Lists /dev/video* nodes that report V4L2 capture capability.
std::vector<std::string> list_capture_devices();

#ifdef __linux__
class CaptureV4L2 : public CameraDevice {
public:
  explicit CaptureV4L2(std::string device_id);
  ~CaptureV4L2() override;

  bool open(CaptureParams &params, std::string &error) override;
  GrabStatus grab(std::string &out, std::string &error) override;
  PixelFormat pixel_format() const override { return pixel_format_; }
  int bytes_per_line() const override { return bytes_per_line_; }
  void release() override;

private:
  bool configure_device(int fd, CaptureParams &params, std::string &error);
  bool negotiate_format(int fd, CaptureParams &params, std::string &error);
  void apply_jpeg_quality(int fd, CaptureParams &params);
  void apply_frame_rate(int fd, CaptureParams &params);
  bool setup_mmap(int fd, std::string &error);
  GrabStatus grab_mmap(int fd, std::string &out, std::string &error);
  GrabStatus grab_read(int fd, std::string &out, std::string &error);
  void cleanup_mmap_setup_failure(int fd);
  void cleanup_mmap_buffers();

  std::string device_id_;
  PixelFormat pixel_format_ = PixelFormat::UNKNOWN;
  std::atomic<int> fd_{-1};
  // Guards buffer access against a concurrent release().
  std::mutex io_mu_;

  bool use_mmap_ = false;
  static constexpr unsigned kNumBuffers = 4;
  struct MmapBuffer {
    void *start = nullptr;
    size_t length = 0;
  };
  MmapBuffer buffers_[kNumBuffers];
  unsigned num_buffers_ = 0;
  size_t frame_size_ = 0;
  int bytes_per_line_ = 0;
  std::string read_buf_;
};

class V4l2CameraProvider : public CameraProvider {
public:
  V4l2CameraProvider(std::string device_id, std::string card)
      : device_id_(std::move(device_id)), card_(std::move(card)) {}

  bool available() const override { return true; }
  std::string description() const override {
    return card_ + " (" + device_id_ + ")";
  }
  std::unique_ptr<CameraDevice> create_device() override {
    return std::make_unique<CaptureV4L2>(device_id_);
  }

private:
  std::string device_id_;
  std::string card_;
};
#endif
