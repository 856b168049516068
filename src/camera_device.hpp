#pragma once

#include <memory>
#include <string>
#include <utility>

#include "types.hpp"

enum class GrabStatus {
  Frame,
  Timeout, // nothing ready within the device's poll window, not an error
  Error
};

// A single opened camera. Owned by exactly one CaptureProducer.
class CameraDevice {
public:
  virtual ~CameraDevice() = default;

  // Opens and configures the device. `params` is updated with what the driver
  // actually accepted.
  virtual bool open(CaptureParams &params, std::string &error) = 0;
  // Blocks for at most one poll window.
  virtual GrabStatus grab(std::string &out, std::string &error) = 0;
  virtual PixelFormat pixel_format() const = 0;
  // Row pitch of raw frames in bytes; 0 means rows are tightly packed.
  virtual int bytes_per_line() const { return 0; }
  // Must be idempotent and safe to call while another thread sits in grab().
  virtual void release() = 0;
};

// Result of the one-time camera capability check done at startup.
class CameraProvider {
public:
  virtual ~CameraProvider() = default;

  virtual bool available() const = 0;
  virtual std::string description() const = 0;
  // Returns nullptr when unavailable.
  virtual std::unique_ptr<CameraDevice> create_device() = 0;
};

class UnavailableCameraProvider : public CameraProvider {
public:
  explicit UnavailableCameraProvider(std::string reason)
      : reason_(std::move(reason)) {}

  bool available() const override { return false; }
  std::string description() const override { return reason_; }
  std::unique_ptr<CameraDevice> create_device() override { return nullptr; }

private:
  std::string reason_;
};

// Probes /dev/<device_id> for V4L2 capture support. Always returns a provider;
// the unavailable variant explains why.
std::unique_ptr<CameraProvider>
probe_camera_provider(const std::string &device_id);
