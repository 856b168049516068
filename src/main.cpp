#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "httplib.h"
#include "camera_device.hpp"
#include "capture_producer.hpp"
#include "config.hpp"
#include "email_notifier.hpp"
#include "http_api.hpp"
#include "lifecycle_controller.hpp"
#include "motor_relay.hpp"
#include "net_utils.hpp"
#include "placeholder.hpp"
#include "server_runner.hpp"
#include "signal_watcher.hpp"
#include "tunnel_process.hpp"

using namespace std::chrono_literals;

namespace {
// Worker threads per listening server. Each viewer holds one for the life of
// its stream.
constexpr size_t kServerThreads = 32;

void print_banner(const std::string &access_url, const std::string &local_url,
                  const LifecycleController &lifecycle,
                  const MotorRelay &relay) {
  const auto tunnel = lifecycle.tunnel_url();
  const CaptureProducer &producer = lifecycle.producer();
  std::cout << "============================================================\n"
            << "RoverCam is up\n"
            << "  Web UI & local API : " << local_url << "\n"
            << "  Public tunnel      : "
            << (tunnel ? *tunnel : std::string("not active")) << "\n"
            << "  Motor controller   : " << relay.target() << "\n"
            << "  Camera             : "
            << (!producer.camera_available()
                    ? "not available"
                    : (producer.running() ? "running" : "not running"))
            << "\n"
            << "  Access URL         : " << access_url << "\n"
            << "Press Ctrl+C to shut down.\n"
            << "============================================================"
            << std::endl;
}
} // namespace

int main(int argc, char *argv[]) {
  Config cfg;
  std::string error;
  switch (parse_args(argc, argv, cfg, error)) {
  case ParseOutcome::Help:
    print_usage(std::cout);
    return 0;
  case ParseOutcome::Error:
    std::cerr << "rovercam: " << error << "\n";
    print_usage(std::cerr);
    return 2;
  case ParseOutcome::Ok:
    break;
  }

  std::signal(SIGPIPE, SIG_IGN);
  std::cout << "[Main] Starting RoverCam on " << cfg.addr << ":" << cfg.port
            << std::endl;

  auto slot = std::make_shared<FrameSlot>();
  CaptureProducer::Timing timing;
  timing.warmup = std::chrono::milliseconds(cfg.warmup_ms);
  auto producer = std::make_unique<CaptureProducer>(
      probe_camera_provider(cfg.device), slot, timing);

  std::unique_ptr<Tunnel> tunnel;
  if (cfg.enable_tunnel)
    tunnel = std::make_unique<TunnelProcess>(
        TunnelProcess::cloudflared_command(cfg.port));

  LifecycleOptions options;
  options.capture = cfg.capture;
  options.local_ip = net::local_ip();
  options.web_port = cfg.port;
  options.tunnel_timeout = std::chrono::seconds(cfg.tunnel_timeout_s);

  LifecycleController lifecycle(
      std::move(producer), std::move(tunnel),
      [] { return net::internet_available(1s); }, options);
  MotorRelay relay(cfg.relay_host, cfg.relay_port);
  PlaceholderRenderer renderer(
      cfg.capture.width, cfg.capture.height,
      PlaceholderRenderer::quality_for_capture(cfg.capture.quality));

  httplib::Server svr;
  svr.new_task_queue = [] { return new httplib::ThreadPool(kServerThreads); };
  RoverApi api(lifecycle, relay, renderer,
               StreamPolicy::for_fps(cfg.stream_fps));
  api.register_routes(svr);

  // Bind before the camera and tunnel come up so a busy port fails fast.
  if (!svr.bind_to_port(cfg.addr, cfg.port)) {
    std::cerr << "[Main] Failed to listen on " << cfg.addr << ":" << cfg.port
              << "\n";
    return 1;
  }
  ServerRunner runner(svr);

  // No thread exists yet, so every thread started from here on inherits the
  // blocked mask and only the watcher sees SIGINT/SIGTERM. A signal during
  // startup aborts it.
  SignalWatcher signals({SIGINT, SIGTERM}, [&](int) {
    lifecycle.shutdown();
    runner.request_stop();
  });

  const std::string access_url = lifecycle.startup();
  const std::string local_url = lifecycle.local_url();

  if (!signals.triggered()) {
    EmailSettings email;
    email.smtp_host = cfg.smtp_host;
    email.smtp_port = cfg.smtp_port;
    email.sender = cfg.email_from;
    email.recipients = cfg.email_to;
    email.password = cfg.smtp_password;
    EmailNotifier notifier(email);
    notifier.notify(access_url, local_url);
    print_banner(access_url, local_url, lifecycle, relay);
  }

  const bool served = runner.run();
  if (!served)
    std::cerr << "[Main] Server loop ended with an error\n";

  lifecycle.shutdown();
  signals.stop();
  std::cout << "[Main] Server has shut down" << std::endl;
  return served ? 0 : 1;
}
