#include "signal_watcher.hpp"

#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace {
constexpr int kWakeSignal = SIGUSR1;
}

SignalWatcher::SignalWatcher(std::vector<int> signals, Handler handler)
    : handler_(std::move(handler)) {
  sigemptyset(&set_);
  for (int sig : signals)
    sigaddset(&set_, sig);
  sigaddset(&set_, kWakeSignal);
  const int rc = pthread_sigmask(SIG_BLOCK, &set_, nullptr);
  if (rc != 0)
    throw std::runtime_error(std::string("pthread_sigmask failed: ") +
                             std::strerror(rc));
  thread_ = std::thread(&SignalWatcher::wait_loop, this);
}

SignalWatcher::~SignalWatcher() { stop(); }

void SignalWatcher::wait_loop() {
  for (;;) {
    int sig = 0;
    const int rc = sigwait(&set_, &sig);
    if (rc != 0) {
      std::cerr << "[Signal] sigwait failed: " << std::strerror(rc) << "\n";
      return;
    }
    if (sig == kWakeSignal) {
      if (stopping_)
        return;
      continue;
    }
    caught_ = sig;
    std::cout << "\n[Signal] Caught signal " << sig << ", shutting down"
              << std::endl;
    if (handler_)
      handler_(sig);
    return;
  }
}

void SignalWatcher::raise(int sig) {
  if (thread_.joinable())
    pthread_kill(thread_.native_handle(), sig);
}

void SignalWatcher::stop() {
  if (stopping_.exchange(true))
    return;
  if (!thread_.joinable())
    return;
  // The thread may already have returned after a signal; it is still
  // joinable, so its handle stays valid for pthread_kill.
  pthread_kill(thread_.native_handle(), kWakeSignal);
  thread_.join();
}
