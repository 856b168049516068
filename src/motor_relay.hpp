#pragma once

#include <chrono>
#include <optional>
#include <string>

struct RelayResult {
  bool ok = false;
  std::string message;
};

// Fire-and-forget link to the motor controller: one short TCP connection per
// command carrying a single ASCII byte. Nothing is retried.
class MotorRelay {
public:
  MotorRelay(std::string host, int port,
             std::chrono::milliseconds send_timeout = std::chrono::milliseconds(1000),
             std::chrono::milliseconds probe_timeout = std::chrono::milliseconds(500));

  // up/down/left/right/stop (any case) -> F/B/L/R/S.
  static std::optional<char> command_for_direction(const std::string &direction);

  RelayResult send_command(char command) const;
  bool is_reachable() const;

  std::string target() const { return host_ + ":" + std::to_string(port_); }

private:
  std::string host_;
  int port_;
  std::chrono::milliseconds send_timeout_;
  std::chrono::milliseconds probe_timeout_;
};
