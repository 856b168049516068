#pragma once

#include <arpa/inet.h>
#include <atomic>
#include <mutex>
#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

// TCP listener on 127.0.0.1 with an ephemeral port. Records the bytes of every
// accepted connection, one entry per connection, once the peer closes.
class LoopbackListener {
public:
  LoopbackListener() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    int one = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
    ::listen(fd_, 16);
    socklen_t len = sizeof(addr);
    ::getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len);
    port_ = ntohs(addr.sin_port);
    thread_ = std::thread([this] { accept_loop(); });
  }

  ~LoopbackListener() { close(); }

  void close() {
    stop_ = true;
    if (thread_.joinable())
      thread_.join();
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int port() const { return port_; }

  std::vector<std::string> received() {
    std::lock_guard<std::mutex> lock(mu_);
    return received_;
  }

  // Port that refuses connections: bound once, then released.
  static int closed_port() {
    LoopbackListener l;
    const int port = l.port();
    l.close();
    return port;
  }

private:
  void accept_loop() {
    while (!stop_) {
      pollfd pfd{fd_, POLLIN, 0};
      if (::poll(&pfd, 1, 20) <= 0)
        continue;
      const int conn = ::accept(fd_, nullptr, nullptr);
      if (conn < 0)
        continue;
      std::string data;
      char buf[256];
      for (;;) {
        const ssize_t n = ::recv(conn, buf, sizeof(buf), 0);
        if (n <= 0)
          break;
        data.append(buf, static_cast<size_t>(n));
      }
      ::close(conn);
      std::lock_guard<std::mutex> lock(mu_);
      received_.push_back(data);
    }
  }

  int fd_ = -1;
  int port_ = 0;
  std::atomic<bool> stop_{false};
  std::thread thread_;
  std::mutex mu_;
  std::vector<std::string> received_;
};
