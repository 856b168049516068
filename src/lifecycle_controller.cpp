#include "lifecycle_controller.hpp"

#include <exception>
#include <iostream>

LifecycleController::LifecycleController(
    std::unique_ptr<CaptureProducer> producer, std::unique_ptr<Tunnel> tunnel,
    InternetProbe internet_probe, LifecycleOptions options)
    : producer_(std::move(producer)), tunnel_(std::move(tunnel)),
      internet_probe_(std::move(internet_probe)),
      options_(std::move(options)) {}

LifecycleController::~LifecycleController() { shutdown(); }

std::optional<std::string> LifecycleController::tunnel_url() const {
  std::lock_guard<std::mutex> lock(url_mu_);
  return tunnel_url_;
}

std::string LifecycleController::local_url() const {
  return "http://" + options_.local_ip + ":" +
         std::to_string(options_.web_port);
}

std::string LifecycleController::startup() {
  if (shut_down_) {
    std::cout << "[Lifecycle] Shutdown requested; skipping startup"
              << std::endl;
    return local_url();
  }
  if (producer_->camera_available()) {
    std::cout << "[Lifecycle] Camera available: "
              << producer_->camera_description() << std::endl;
    if (producer_->start(options_.capture)) {
      // shutdown() may have run while the camera was warming up.
      if (shut_down_) {
        producer_->stop();
        return local_url();
      }
      std::cout << "[Lifecycle] Camera running" << std::endl;
    } else {
      std::cerr << "[Lifecycle] Camera failed to start; video will show "
                   "the offline placeholder\n";
    }
  } else {
    std::cerr << "[Lifecycle] Camera support unavailable ("
              << producer_->camera_description()
              << "); video will show the offline placeholder\n";
  }

  if (!tunnel_) {
    std::cout << "[Lifecycle] Tunnel disabled" << std::endl;
    return local_url();
  }
  if (shut_down_)
    return local_url();
  if (internet_probe_ && !internet_probe_()) {
    std::cerr << "[Lifecycle] No internet connection; skipping tunnel\n";
    return local_url();
  }
  auto url = tunnel_->start(options_.tunnel_timeout);
  if (!url) {
    std::cerr << "[Lifecycle] Tunnel did not come up; using local URL\n";
    return local_url();
  }
  {
    std::lock_guard<std::mutex> lock(url_mu_);
    if (shut_down_)
      return local_url();
    tunnel_url_ = url;
  }
  return *url;
}

void LifecycleController::shutdown() {
  if (shut_down_.exchange(true))
    return;
  std::cout << "[Lifecycle] Shutting down..." << std::endl;

  try {
    gate_.close();
  } catch (const std::exception &e) {
    std::cerr << "[Lifecycle] Error closing streams: " << e.what() << "\n";
  }

  try {
    producer_->stop();
  } catch (const std::exception &e) {
    std::cerr << "[Lifecycle] Error stopping camera: " << e.what() << "\n";
  }

  if (tunnel_) {
    try {
      tunnel_->stop();
    } catch (const std::exception &e) {
      std::cerr << "[Lifecycle] Error stopping tunnel: " << e.what() << "\n";
    }
  }
  {
    std::lock_guard<std::mutex> lock(url_mu_);
    tunnel_url_.reset();
  }
  std::cout << "[Lifecycle] Shutdown complete" << std::endl;
}
