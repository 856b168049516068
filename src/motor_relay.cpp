#include "motor_relay.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <utility>

#include "net_utils.hpp"

MotorRelay::MotorRelay(std::string host, int port,
                       std::chrono::milliseconds send_timeout,
                       std::chrono::milliseconds probe_timeout)
    : host_(std::move(host)), port_(port), send_timeout_(send_timeout),
      probe_timeout_(probe_timeout) {}

std::optional<char>
MotorRelay::command_for_direction(const std::string &direction) {
  std::string d = direction;
  std::transform(d.begin(), d.end(), d.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (d == "up")
    return 'F';
  if (d == "down")
    return 'B';
  if (d == "left")
    return 'L';
  if (d == "right")
    return 'R';
  if (d == "stop")
    return 'S';
  return std::nullopt;
}

RelayResult MotorRelay::send_command(char command) const {
  const std::string quoted = std::string("'") + command + "'";
  RelayResult result;
  std::string error;
  int fd = net::connect_with_timeout(host_, port_, send_timeout_, error);
  if (fd < 0) {
    result.message = error == "timeout"
                         ? "Timeout sending " + quoted + " to motor controller."
                         : "Socket error sending " + quoted + ": " + error;
    std::cerr << "[Relay] " << result.message << "\n";
    return result;
  }

  timeval tv{};
  tv.tv_sec = static_cast<time_t>(send_timeout_.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((send_timeout_.count() % 1000) * 1000);
  if (::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
    std::cerr << "[Relay] SO_SNDTIMEO failed: " << std::strerror(errno)
              << "\n";
  }

  ssize_t n;
  do {
    n = ::send(fd, &command, 1, MSG_NOSIGNAL);
  } while (n < 0 && errno == EINTR);
  if (n == 1) {
    result.ok = true;
    result.message = "Command " + quoted + " sent to motor controller.";
  } else if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
    result.message = "Timeout sending " + quoted + " to motor controller.";
  } else {
    result.message = "Socket error sending " + quoted + ": " +
                     (n < 0 ? std::strerror(errno) : "short write");
  }
  ::close(fd);
  if (!result.ok)
    std::cerr << "[Relay] " << result.message << "\n";
  return result;
}

bool MotorRelay::is_reachable() const {
  std::string error;
  int fd = net::connect_with_timeout(host_, port_, probe_timeout_, error);
  if (fd < 0)
    return false;
  ::close(fd);
  return true;
}
