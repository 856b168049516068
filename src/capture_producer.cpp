#include "capture_producer.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <system_error>
#include <utility>

#include "jpeg_encoder.hpp"

// State shared between the producer and its capture thread. The thread keeps
// its own reference, so an abandoned thread never touches a destroyed
// producer.
struct CaptureProducer::Worker {
  std::shared_ptr<CameraDevice> device;
  std::function<void(Worker &, const std::string &)> fault_handler;

  std::mutex mu;
  std::condition_variable exited_cv;
  bool stop_requested = false;
  bool exited = false;
  // Set when stop() gives up on the thread; it must stay silent from then on,
  // since it may still be running while the process exits.
  bool abandoned = false;
  std::once_flag release_once;

  bool should_stop() {
    std::lock_guard<std::mutex> lock(mu);
    return stop_requested;
  }

  void request_stop() {
    std::lock_guard<std::mutex> lock(mu);
    stop_requested = true;
    fault_handler = nullptr;
  }

  bool wait_exited(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu);
    return exited_cv.wait_for(lock, timeout, [this] { return exited; });
  }

  void abandon() {
    std::lock_guard<std::mutex> lock(mu);
    abandoned = true;
  }

  void log_exit(uint64_t frames) {
    std::lock_guard<std::mutex> lock(mu);
    if (abandoned)
      return;
    std::cout << "[Capture] Capture loop exited after " << frames << " frames"
              << std::endl;
  }

  void mark_exited() {
    {
      std::lock_guard<std::mutex> lock(mu);
      exited = true;
    }
    exited_cv.notify_all();
  }

  // Publishing under `mu` means nothing lands in the slot after stop() has
  // requested the exit and cleared it.
  bool publish(FrameSlot &slot, std::string jpeg) {
    std::lock_guard<std::mutex> lock(mu);
    if (stop_requested)
      return false;
    slot.publish(std::move(jpeg));
    return true;
  }

  void report_fault(const std::string &message) {
    std::lock_guard<std::mutex> lock(mu);
    if (stop_requested || !fault_handler)
      return;
    auto handler = std::move(fault_handler);
    fault_handler = nullptr;
    handler(*this, message);
  }

  void release_device() {
    std::call_once(release_once, [this] {
      if (!device)
        return;
      try {
        device->release();
      } catch (const std::exception &e) {
        std::cerr << "[Capture] Error releasing camera: " << e.what() << "\n";
      }
    });
  }
};

CaptureProducer::CaptureProducer(std::unique_ptr<CameraProvider> provider,
                                 std::shared_ptr<FrameSlot> slot)
    : CaptureProducer(std::move(provider), std::move(slot), Timing{}) {}

CaptureProducer::CaptureProducer(std::unique_ptr<CameraProvider> provider,
                                 std::shared_ptr<FrameSlot> slot,
                                 Timing timing)
    : provider_(std::move(provider)), slot_(std::move(slot)),
      timing_(timing) {
  if (!provider_)
    provider_ = std::make_unique<UnavailableCameraProvider>("no provider");
  if (!slot_)
    slot_ = std::make_shared<FrameSlot>();
}

CaptureProducer::~CaptureProducer() { stop(); }

bool CaptureProducer::camera_available() const {
  return provider_->available();
}

std::string CaptureProducer::camera_description() const {
  return provider_->description();
}

CaptureParams CaptureProducer::params() const {
  std::lock_guard<std::mutex> lock(info_mu_);
  return params_;
}

std::string CaptureProducer::last_fault() const {
  std::lock_guard<std::mutex> lock(info_mu_);
  return last_fault_;
}

bool CaptureProducer::wait_warmup() {
  std::unique_lock<std::mutex> lock(warmup_mu_);
  return !warmup_cv_.wait_for(lock, timing_.warmup,
                              [this] { return abort_start_; });
}

bool CaptureProducer::start(const CaptureParams &params) {
  std::lock_guard<std::mutex> lock(control_mu_);
  if (state_ == CaptureState::Running) {
    std::cout << "[Capture] Camera already running" << std::endl;
    return true;
  }
  {
    std::lock_guard<std::mutex> info(info_mu_);
    params_ = params;
  }
  if (!provider_->available()) {
    std::cerr << "[Capture] Cannot start camera: " << provider_->description()
              << "\n";
    return false;
  }

  // A thread that stopped itself after a fault is finished; reap it.
  if (thread_.joinable())
    thread_.join();
  worker_.reset();
  {
    std::lock_guard<std::mutex> warm(warmup_mu_);
    abort_start_ = false;
  }

  state_ = CaptureState::Starting;
  auto worker = std::make_shared<Worker>();
  worker->device = provider_->create_device();
  if (!worker->device) {
    std::cerr << "[Capture] Camera provider returned no device\n";
    state_ = CaptureState::Stopped;
    return false;
  }

  CaptureParams effective = params;
  std::string error;
  bool opened = false;
  try {
    opened = worker->device->open(effective, error);
  } catch (const std::exception &e) {
    error = e.what();
  }
  if (!opened) {
    std::cerr << "[Capture] Error initializing camera: " << error << "\n";
    worker->release_device();
    {
      std::lock_guard<std::mutex> info(info_mu_);
      last_fault_ = error;
    }
    state_ = CaptureState::Stopped;
    return false;
  }

  std::cout << "[Capture] Camera configured: " << effective.width << "x"
            << effective.height << " @ " << effective.fps
            << " FPS, JPEG quality " << effective.quality << std::endl;
  std::cout << "[Capture] Giving the camera " << timing_.warmup.count()
            << "ms to warm up..." << std::endl;
  if (!wait_warmup()) {
    std::cout << "[Capture] Start aborted during warm-up" << std::endl;
    worker->release_device();
    state_ = CaptureState::Stopped;
    return false;
  }

  {
    std::lock_guard<std::mutex> info(info_mu_);
    params_ = effective;
    last_fault_.clear();
  }
  worker->fault_handler = [this](Worker &w, const std::string &message) {
    on_fault(w, message);
  };
  worker_ = worker;
  state_ = CaptureState::Running;
  try {
    thread_ = std::thread(&CaptureProducer::capture_loop, worker, slot_,
                          effective, worker->device->pixel_format(),
                          worker->device->bytes_per_line());
  } catch (const std::system_error &e) {
    std::cerr << "[Capture] Failed to launch capture thread: " << e.what()
              << "\n";
    worker->request_stop();
    worker->release_device();
    worker_.reset();
    state_ = CaptureState::Stopped;
    return false;
  }
  std::cout << "[Capture] Capture started" << std::endl;
  return true;
}

void CaptureProducer::stop() {
  {
    std::lock_guard<std::mutex> warm(warmup_mu_);
    abort_start_ = true;
  }
  warmup_cv_.notify_all();

  std::lock_guard<std::mutex> lock(control_mu_);
  const CaptureState before = state_.load();
  if (before != CaptureState::Stopped) {
    state_ = CaptureState::Stopping;
    std::cout << "[Capture] Stopping camera (was "
              << capture_state_label(before) << ")..." << std::endl;
  }

  auto worker = std::move(worker_);
  if (worker) {
    worker->request_stop();
    if (thread_.joinable()) {
      if (worker->wait_exited(timing_.stop_timeout)) {
        thread_.join();
      } else {
        std::cerr << "[Capture] Capture thread did not exit within "
                  << timing_.stop_timeout.count()
                  << "ms; releasing the camera anyway\n";
        worker->abandon();
        thread_.detach();
      }
    }
    worker->release_device();
  } else if (thread_.joinable()) {
    thread_.join();
  }

  slot_->clear();
  state_ = CaptureState::Stopped;
  if (before != CaptureState::Stopped)
    std::cout << "[Capture] Camera stopped" << std::endl;
}

void CaptureProducer::on_fault(Worker &worker, const std::string &message) {
  {
    std::lock_guard<std::mutex> info(info_mu_);
    last_fault_ = message;
  }
  std::cerr << "[Capture] Camera fault: " << message
            << " (video goes offline)\n";
  worker.release_device();
  slot_->clear();
  CaptureState expected = CaptureState::Running;
  state_.compare_exchange_strong(expected, CaptureState::Stopped);
}

void CaptureProducer::capture_loop(std::shared_ptr<Worker> worker,
                                   std::shared_ptr<FrameSlot> slot,
                                   CaptureParams params, PixelFormat format,
                                   int stride) {
  std::string raw;
  std::string jpeg;
  std::string error;
  uint64_t frames = 0;
  const int pitch = stride > 0 ? stride : params.width * 2;
  const size_t yuyv_size = static_cast<size_t>(pitch) * params.height;

  while (!worker->should_stop()) {
    GrabStatus status = GrabStatus::Error;
    try {
      status = worker->device->grab(raw, error);
    } catch (const std::exception &e) {
      error = e.what();
    }
    if (status == GrabStatus::Timeout)
      continue;
    if (status == GrabStatus::Error) {
      worker->report_fault("frame grab failed: " + error);
      break;
    }

    if (format == PixelFormat::MJPEG) {
      if (raw.size() < 2 || static_cast<unsigned char>(raw[0]) != 0xFF ||
          static_cast<unsigned char>(raw[1]) != 0xD8) {
        continue; // drivers occasionally hand out an empty/corrupt buffer
      }
      jpeg.swap(raw);
    } else if (format == PixelFormat::YUYV) {
      if (raw.size() < yuyv_size)
        continue;
      if (!encode_yuyv_jpeg(reinterpret_cast<const uint8_t *>(raw.data()),
                            params.width, params.height, params.quality, jpeg,
                            error, pitch)) {
        worker->report_fault("JPEG encode failed: " + error);
        break;
      }
    } else {
      worker->report_fault("unsupported pixel format");
      break;
    }

    if (!worker->publish(*slot, std::move(jpeg)))
      break;
    jpeg.clear();
    ++frames;
  }

  worker->log_exit(frames);
  worker->mark_exited();
}
