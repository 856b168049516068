#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <pthread.h>
#include <thread>
#include <vector>

// Blocks `signals` in the constructing thread (and so in every thread it
// starts afterwards) and waits for them with sigwait() on a thread of its
// own. The handler runs once, on that thread, for the first signal caught.
class SignalWatcher {
public:
  using Handler = std::function<void(int)>;

  // SIGUSR1 is reserved for waking the watcher and must not be in `signals`.
  SignalWatcher(std::vector<int> signals, Handler handler);
  ~SignalWatcher();

  SignalWatcher(const SignalWatcher &) = delete;
  SignalWatcher &operator=(const SignalWatcher &) = delete;

  // Delivers `sig` to the watcher thread.
  void raise(int sig);
  // Ends the watcher without running the handler if nothing was caught yet.
  // Idempotent.
  void stop();

  bool triggered() const { return caught_ != 0; }
  int signal() const { return caught_; }

private:
  void wait_loop();

  sigset_t set_;
  Handler handler_;
  std::atomic<int> caught_{0};
  std::atomic<bool> stopping_{false};
  std::thread thread_;
};
