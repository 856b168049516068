#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

struct FrameSnapshot {
  std::shared_ptr<const std::string> bytes;
  std::chrono::steady_clock::time_point captured_at;
  std::chrono::steady_clock::duration age;
  uint64_t sequence = 0;
};

// Holds the most recent encoded frame. One writer, any number of readers.
// Payloads are immutable once published, so readers share the buffer and the
// lock only guards a pointer/timestamp copy.
class FrameSlot {
public:
  using Clock = std::chrono::steady_clock;

  void publish(std::string bytes);
  void publish(std::string bytes, Clock::time_point captured_at);
  std::optional<FrameSnapshot> read() const;
  void clear();

private:
  mutable std::mutex mu_;
  std::shared_ptr<const std::string> bytes_;
  Clock::time_point captured_at_{};
  uint64_t sequence_ = 0;
};
