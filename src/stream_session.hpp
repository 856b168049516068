#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "capture_producer.hpp"
#include "placeholder.hpp"

// "Accepting streams" switch shared by every session. Closing it wakes all
// sessions sleeping in wait_for().
class StreamGate {
public:
  bool accepting_streams() const;
  void close();
  // Sleeps up to `d`. Returns false as soon as the gate is closed.
  bool wait_for(std::chrono::milliseconds d);

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool accepting_ = true;
};

// Consumer side of a stream. write() returning false means the client is gone.
class ChunkSink {
public:
  virtual ~ChunkSink() = default;
  virtual bool write(const char *data, size_t size) = 0;
};

struct StreamPolicy {
  std::chrono::milliseconds min_interval{33};
  std::chrono::milliseconds offline_interval{1000};
  std::chrono::milliseconds freshness{1000};

  static StreamPolicy for_fps(int max_fps);
};

// One decision of the pacing loop: what to send (maybe nothing) and how long
// to sleep afterwards.
struct StreamStep {
  std::shared_ptr<const std::string> payload;
  bool placeholder = false;
  std::chrono::milliseconds pause{0};
};

namespace stream {
// "--frame\r\nContent-Type: image/jpeg\r\nContent-Length: N\r\n\r\n"
std::string mjpeg_part_header(size_t content_length);
constexpr const char *kMjpegBoundary = "frame";
} // namespace stream

// Per-client MJPEG pacing loop. Holds nothing but its counters; the producer,
// renderer and gate outlive it.
class StreamSession {
public:
  enum class EndReason { ClientGone, Shutdown };

  StreamSession(const CaptureProducer &producer, PlaceholderRenderer &renderer,
                StreamGate &gate, StreamPolicy policy = {});

  StreamStep next_step();
  // Writes one multipart part. False if the sink rejected any piece.
  bool emit(ChunkSink &sink, const std::string &jpeg);
  EndReason run(ChunkSink &sink);

  uint64_t frames_sent() const { return frames_sent_; }
  uint64_t bytes_sent() const { return bytes_sent_; }

private:
  const CaptureProducer &producer_;
  PlaceholderRenderer &renderer_;
  StreamGate &gate_;
  StreamPolicy policy_;
  uint64_t frames_sent_ = 0;
  uint64_t bytes_sent_ = 0;
};
