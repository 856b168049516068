#include "net_utils.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace net {
namespace {
bool set_blocking(int fd, bool blocking) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0)
    return false;
  const int next = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
  return fcntl(fd, F_SETFL, next) == 0;
}

int connect_addr(const sockaddr *addr, socklen_t len, int timeout_ms,
                 std::string &error) {
  int fd = ::socket(addr->sa_family, SOCK_STREAM, IPPROTO_TCP);
  if (fd < 0) {
    error = std::strerror(errno);
    return -1;
  }
  if (!set_blocking(fd, false)) {
    error = std::strerror(errno);
    ::close(fd);
    return -1;
  }

  if (::connect(fd, addr, len) != 0) {
    if (errno != EINPROGRESS) {
      error = std::strerror(errno);
      ::close(fd);
      return -1;
    }
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLOUT;
    int r;
    do {
      r = ::poll(&pfd, 1, timeout_ms);
    } while (r < 0 && errno == EINTR);
    if (r == 0) {
      error = "timeout";
      ::close(fd);
      return -1;
    }
    if (r < 0) {
      error = std::strerror(errno);
      ::close(fd);
      return -1;
    }
    int so_error = 0;
    socklen_t so_len = sizeof(so_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) != 0 ||
        so_error != 0) {
      error = std::strerror(so_error != 0 ? so_error : errno);
      ::close(fd);
      return -1;
    }
  }

  if (!set_blocking(fd, true)) {
    error = std::strerror(errno);
    ::close(fd);
    return -1;
  }
  return fd;
}
} // namespace

int connect_with_timeout(const std::string &host, int port,
                         std::chrono::milliseconds timeout,
                         std::string &error) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *res = nullptr;
  const std::string service = std::to_string(port);
  const int gai = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
  if (gai != 0) {
    error = std::string("cannot resolve ") + host + ": " + gai_strerror(gai);
    return -1;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  int fd = -1;
  for (addrinfo *ai = res; ai && fd < 0; ai = ai->ai_next) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      error = "timeout";
      break;
    }
    fd = connect_addr(ai->ai_addr, ai->ai_addrlen,
                      static_cast<int>(left.count()), error);
  }
  ::freeaddrinfo(res);
  return fd;
}

std::string local_ip() {
  int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0)
    return "127.0.0.1";

  // UDP connect sends nothing; it only picks the outgoing interface.
  sockaddr_in remote{};
  remote.sin_family = AF_INET;
  remote.sin_port = htons(80);
  ::inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);
  std::string ip = "127.0.0.1";
  if (::connect(fd, reinterpret_cast<sockaddr *>(&remote), sizeof(remote)) ==
      0) {
    sockaddr_in local{};
    socklen_t len = sizeof(local);
    char buf[INET_ADDRSTRLEN] = {0};
    if (::getsockname(fd, reinterpret_cast<sockaddr *>(&local), &len) == 0 &&
        ::inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf))) {
      ip = buf;
    }
  }
  ::close(fd);
  return ip;
}

bool internet_available(std::chrono::milliseconds timeout) {
  std::string error;
  int fd = connect_with_timeout("8.8.8.8", 53, timeout, error);
  if (fd < 0)
    return false;
  ::close(fd);
  return true;
}

} // namespace net
