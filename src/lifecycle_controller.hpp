#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "capture_producer.hpp"
#include "stream_session.hpp"
#include "tunnel_process.hpp"
#include "types.hpp"

struct LifecycleOptions {
  CaptureParams capture;
  std::string local_ip = "127.0.0.1";
  int web_port = 5000;
  std::chrono::milliseconds tunnel_timeout{30000};
};

// Owns the producer, the tunnel and the "accepting streams" gate, and runs
// startup/shutdown in a fixed order.
class LifecycleController {
public:
  using InternetProbe = std::function<bool()>;

  // `tunnel` may be null (tunnel disabled). `internet_probe` gates the
  // tunnel launch.
  LifecycleController(std::unique_ptr<CaptureProducer> producer,
                      std::unique_ptr<Tunnel> tunnel,
                      InternetProbe internet_probe, LifecycleOptions options);
  ~LifecycleController();

  LifecycleController(const LifecycleController &) = delete;
  LifecycleController &operator=(const LifecycleController &) = delete;

  // Returns the access URL: the tunnel URL if one came up, else local_url().
  // A concurrent shutdown() aborts it; it then returns local_url() and leaves
  // nothing running.
  std::string startup();
  // Gate, then producer, then tunnel. Safe to call more than once.
  void shutdown();

  bool accepting_streams() const { return gate_.accepting_streams(); }
  bool wait_for(std::chrono::milliseconds d) { return gate_.wait_for(d); }
  StreamGate &gate() { return gate_; }

  CaptureProducer &producer() { return *producer_; }
  const CaptureProducer &producer() const { return *producer_; }
  std::optional<std::string> tunnel_url() const;
  // True while a tunnel child is up and has reported its URL.
  bool tunnel_active() const { return tunnel_ && tunnel_->active(); }
  std::string local_url() const;
  const LifecycleOptions &options() const { return options_; }

private:
  std::unique_ptr<CaptureProducer> producer_;
  std::unique_ptr<Tunnel> tunnel_;
  InternetProbe internet_probe_;
  LifecycleOptions options_;
  StreamGate gate_;

  mutable std::mutex url_mu_;
  std::optional<std::string> tunnel_url_;
  std::atomic<bool> shut_down_{false};
};
