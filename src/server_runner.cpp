#include "server_runner.hpp"

#include <chrono>
#include <thread>

bool ServerRunner::run() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stop_requested_) {
      finished_ = true;
      return true;
    }
    started_ = true;
  }
  const bool ok = svr_.listen_after_bind();
  std::lock_guard<std::mutex> lock(mu_);
  finished_ = true;
  return ok;
}

void ServerRunner::request_stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stop_requested_)
      return;
    stop_requested_ = true;
    if (!started_)
      return;
  }
  // Server::stop() is a no-op until listen_after_bind() marks it running.
  for (;;) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (finished_)
        return;
    }
    if (svr_.is_running())
      break;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  svr_.stop();
}
