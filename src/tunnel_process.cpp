#include "tunnel_process.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <regex>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
// Longest start() waits in poll() before rechecking for cancellation.
constexpr long long kCancelPollMs = 100;

const std::regex &tunnel_url_regex() {
  static const std::regex re(R"(https://[-a-zA-Z0-9._]+\.trycloudflare\.com)");
  return re;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

// Splits complete lines off `buf`, leaving any partial tail in place.
std::vector<std::string> take_lines(std::string &buf) {
  std::vector<std::string> lines;
  size_t pos;
  while ((pos = buf.find('\n')) != std::string::npos) {
    std::string line = buf.substr(0, pos);
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    lines.push_back(std::move(line));
    buf.erase(0, pos + 1);
  }
  return lines;
}
} // namespace

TunnelLine parse_tunnel_line(const std::string &line) {
  TunnelLine out;
  std::smatch m;
  if (std::regex_search(line, m, tunnel_url_regex())) {
    out.kind = TunnelLine::Kind::Url;
    out.url = m.str(0);
    return out;
  }
  const std::string lower = to_lower(line);
  if (lower.find("failed") != std::string::npos ||
      lower.find("error") != std::string::npos)
    out.kind = TunnelLine::Kind::Error;
  return out;
}

TunnelProcess::TunnelProcess(std::vector<std::string> command)
    : command_(std::move(command)) {}

TunnelProcess::~TunnelProcess() { stop(); }

std::vector<std::string> TunnelProcess::cloudflared_command(int local_port) {
  return {"cloudflared", "tunnel", "--url",
          "http://localhost:" + std::to_string(local_port), "--no-autoupdate"};
}

bool TunnelProcess::active() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pid_ > 0 && !url_.empty();
}

bool TunnelProcess::spawn(std::string &error) {
  if (command_.empty()) {
    error = "empty command";
    return false;
  }
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    error = std::string("pipe failed: ") + std::strerror(errno);
    return false;
  }

  std::vector<char *> argv;
  for (auto &arg : command_)
    argv.push_back(const_cast<char *>(arg.c_str()));
  argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    error = std::string("fork failed: ") + std::strerror(errno);
    ::close(fds[0]);
    ::close(fds[1]);
    return false;
  }
  if (pid == 0) {
    ::setpgid(0, 0);
    // The server blocks its shutdown signals and ignores SIGPIPE; exec keeps
    // both, so undo them for the child.
    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
    ::signal(SIGPIPE, SIG_DFL);
    ::dup2(fds[1], STDOUT_FILENO);
    ::dup2(fds[1], STDERR_FILENO);
    ::execvp(argv[0], argv.data());
    const char msg[] = "exec failed\n";
    ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    ::_exit(127);
  }

  ::setpgid(pid, pid); // also from the parent, whichever runs first
  ::close(fds[1]);
  const int flags = ::fcntl(fds[0], F_GETFL, 0);
  ::fcntl(fds[0], F_SETFL, flags | O_NONBLOCK);
  pid_ = pid;
  out_fd_ = fds[0];
  return true;
}

std::optional<std::string>
TunnelProcess::start(std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(mu_);
  if (pid_ > 0 && !url_.empty())
    return url_;
  if (cancel_)
    return std::nullopt;

  std::cout << "[Tunnel] Starting: " << command_.front() << std::endl;
  std::string error;
  if (!spawn(error)) {
    std::cerr << "[Tunnel] " << error << "\n";
    return std::nullopt;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::string buf;
  char chunk[1024];
  bool done = false;
  while (!done) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      std::cerr << "[Tunnel] Timeout waiting for tunnel URL\n";
      break;
    }
    if (cancel_) {
      std::cout << "[Tunnel] Start cancelled" << std::endl;
      break;
    }
    pollfd pfd{out_fd_, POLLIN, 0};
    const int r = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(
                                      left.count(), kCancelPollMs)));
    if (r < 0 && errno == EINTR)
      continue;
    if (r <= 0)
      continue;

    const ssize_t n = ::read(out_fd_, chunk, sizeof(chunk));
    if (n < 0 && (errno == EAGAIN || errno == EINTR))
      continue;
    if (n <= 0) {
      std::cerr << "[Tunnel] Process exited before reporting a URL\n";
      break;
    }
    buf.append(chunk, static_cast<size_t>(n));
    for (const auto &line : take_lines(buf)) {
      std::cout << "[Tunnel] " << line << std::endl;
      const TunnelLine parsed = parse_tunnel_line(line);
      if (parsed.kind == TunnelLine::Kind::Url) {
        url_ = parsed.url;
        done = true;
        break;
      }
      if (parsed.kind == TunnelLine::Kind::Error) {
        std::cerr << "[Tunnel] Tunnel client reported an error\n";
        done = true;
        break;
      }
    }
  }

  if (url_.empty() || cancel_) {
    url_.clear();
    terminate_child();
    return std::nullopt;
  }

  std::cout << "[Tunnel] Established: " << url_ << std::endl;
  stop_drain_ = false;
  drain_thread_ = std::thread(&TunnelProcess::drain_loop, this);
  return url_;
}

void TunnelProcess::drain_loop() {
  std::string buf;
  char chunk[1024];
  while (!stop_drain_) {
    pollfd pfd{out_fd_, POLLIN, 0};
    const int r = ::poll(&pfd, 1, 200);
    if (r <= 0)
      continue;
    const ssize_t n = ::read(out_fd_, chunk, sizeof(chunk));
    if (n < 0 && (errno == EAGAIN || errno == EINTR))
      continue;
    if (n <= 0)
      break;
    buf.append(chunk, static_cast<size_t>(n));
    for (const auto &line : take_lines(buf))
      std::cout << "[Tunnel] " << line << std::endl;
  }
}

void TunnelProcess::terminate_child() {
  if (pid_ > 0) {
    ::kill(-pid_, SIGTERM);
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::seconds(3);
    bool reaped = false;
    while (std::chrono::steady_clock::now() < deadline) {
      const pid_t r = ::waitpid(pid_, nullptr, WNOHANG);
      if (r == pid_ || (r < 0 && errno == ECHILD)) {
        reaped = true;
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (!reaped) {
      std::cerr << "[Tunnel] Process did not exit after SIGTERM, killing\n";
      ::kill(-pid_, SIGKILL);
      ::waitpid(pid_, nullptr, 0);
    }
    pid_ = -1;
  }
  if (out_fd_ >= 0) {
    ::close(out_fd_);
    out_fd_ = -1;
  }
}

void TunnelProcess::stop() {
  // Set before taking mu_, which start() holds while it waits for the URL.
  cancel_ = true;
  std::lock_guard<std::mutex> lock(mu_);
  stop_drain_ = true;
  if (drain_thread_.joinable())
    drain_thread_.join();
  if (pid_ > 0)
    std::cout << "[Tunnel] Stopping tunnel process" << std::endl;
  terminate_child();
  url_.clear();
}
