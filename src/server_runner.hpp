#pragma once

#include <mutex>

#include "httplib.h"

// Runs an already-bound httplib::Server on the calling thread and stops it
// from any other thread, whether or not the accept loop has started yet.
class ServerRunner {
public:
  explicit ServerRunner(httplib::Server &svr) : svr_(svr) {}

  ServerRunner(const ServerRunner &) = delete;
  ServerRunner &operator=(const ServerRunner &) = delete;

  // Blocks in listen_after_bind() until request_stop(). Returns true at once
  // if a stop was requested first.
  bool run();
  // Idempotent. Waits for run() to reach its accept loop before stopping it.
  void request_stop();

private:
  httplib::Server &svr_;
  std::mutex mu_;
  bool stop_requested_ = false;
  bool started_ = false;
  bool finished_ = false;
};
