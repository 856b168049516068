#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

// Something that makes the local server reachable from outside and reports
// the public URL.
class Tunnel {
public:
  virtual ~Tunnel() = default;
  virtual std::optional<std::string> start(std::chrono::milliseconds timeout) = 0;
  virtual void stop() = 0;
  virtual bool active() const = 0;
};

struct TunnelLine {
  enum class Kind { Other, Url, Error };
  Kind kind = Kind::Other;
  std::string url;
};

// Classifies one line of cloudflared output. A URL wins over an error word on
// the same line.
TunnelLine parse_tunnel_line(const std::string &line);

// Runs a tunnel client as a child process (its own process group) and scrapes
// the public URL from its combined stdout/stderr.
class TunnelProcess : public Tunnel {
public:
  explicit TunnelProcess(std::vector<std::string> command);
  ~TunnelProcess() override;

  TunnelProcess(const TunnelProcess &) = delete;
  TunnelProcess &operator=(const TunnelProcess &) = delete;

  static std::vector<std::string> cloudflared_command(int local_port);

  std::optional<std::string> start(std::chrono::milliseconds timeout) override;
  // Cancels a start() in progress, then SIGTERM, up to 3 s grace, then
  // SIGKILL. Idempotent. A stopped tunnel does not start again.
  void stop() override;
  bool active() const override;

private:
  bool spawn(std::string &error);
  void terminate_child();
  void drain_loop();

  std::vector<std::string> command_;
  mutable std::mutex mu_;
  pid_t pid_ = -1;
  int out_fd_ = -1;
  std::string url_;
  std::thread drain_thread_;
  std::atomic<bool> stop_drain_{false};
  std::atomic<bool> cancel_{false};
};
