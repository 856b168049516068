#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "camera_device.hpp"
#include "frame_slot.hpp"
#include "types.hpp"

// Owns the camera device and the background capture thread that keeps the
// FrameSlot filled with JPEG frames.
//
// State machine: Stopped -> Starting -> Running -> Stopping -> Stopped.
// The device is released exactly once on every path out of Starting/Running,
// including a device fault detected by the capture thread.
class CaptureProducer {
public:
  struct Timing {
    std::chrono::milliseconds warmup{2000};
    std::chrono::milliseconds stop_timeout{3000};
  };

  CaptureProducer(std::unique_ptr<CameraProvider> provider,
                  std::shared_ptr<FrameSlot> slot);
  CaptureProducer(std::unique_ptr<CameraProvider> provider,
                  std::shared_ptr<FrameSlot> slot, Timing timing);
  ~CaptureProducer();

  CaptureProducer(const CaptureProducer &) = delete;
  CaptureProducer &operator=(const CaptureProducer &) = delete;

  // Returns true once Running. A no-op returning true when already Running.
  bool start(const CaptureParams &params);
  // Always ends Stopped with the slot cleared. Waits at most stop_timeout for
  // the capture thread before abandoning it.
  void stop();

  CaptureState state() const { return state_.load(); }
  bool running() const { return state_.load() == CaptureState::Running; }
  bool camera_available() const;
  std::string camera_description() const;
  // Effective params once started, requested params otherwise.
  CaptureParams params() const;
  std::string last_fault() const;
  const std::shared_ptr<FrameSlot> &slot() const { return slot_; }

private:
  struct Worker;

  static void capture_loop(std::shared_ptr<Worker> worker,
                           std::shared_ptr<FrameSlot> slot,
                           CaptureParams params, PixelFormat format,
                           int stride);
  void on_fault(Worker &worker, const std::string &message);
  bool wait_warmup();

  std::unique_ptr<CameraProvider> provider_;
  std::shared_ptr<FrameSlot> slot_;
  const Timing timing_;

  std::mutex control_mu_; // serializes start()/stop()
  std::atomic<CaptureState> state_{CaptureState::Stopped};
  std::shared_ptr<Worker> worker_;
  std::thread thread_;

  mutable std::mutex info_mu_;
  CaptureParams params_;
  std::string last_fault_;

  std::mutex warmup_mu_;
  std::condition_variable warmup_cv_;
  bool abort_start_ = false;
};
