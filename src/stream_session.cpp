#include "stream_session.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

bool StreamGate::accepting_streams() const {
  std::lock_guard<std::mutex> lock(mu_);
  return accepting_;
}

void StreamGate::close() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    accepting_ = false;
  }
  cv_.notify_all();
}

bool StreamGate::wait_for(std::chrono::milliseconds d) {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait_for(lock, d, [this] { return !accepting_; });
  return accepting_;
}

StreamPolicy StreamPolicy::for_fps(int max_fps) {
  StreamPolicy p;
  p.min_interval = std::chrono::milliseconds(1000 / std::max(1, max_fps));
  return p;
}

namespace stream {
std::string mjpeg_part_header(size_t content_length) {
  return "--" + std::string(kMjpegBoundary) +
         "\r\nContent-Type: image/jpeg\r\nContent-Length: " +
         std::to_string(content_length) + "\r\n\r\n";
}
} // namespace stream

StreamSession::StreamSession(const CaptureProducer &producer,
                             PlaceholderRenderer &renderer, StreamGate &gate,
                             StreamPolicy policy)
    : producer_(producer), renderer_(renderer), gate_(gate), policy_(policy) {}

StreamStep StreamSession::next_step() {
  StreamStep step;
  if (!producer_.running()) {
    const OfflineReason reason = producer_.camera_available()
                                     ? OfflineReason::DeviceOffline
                                     : OfflineReason::CapabilityMissing;
    step.payload = renderer_.image(reason);
    step.placeholder = true;
    step.pause = policy_.offline_interval;
    return step;
  }

  auto snap = producer_.slot()->read();
  if (snap && snap->bytes && snap->age < policy_.freshness) {
    step.payload = snap->bytes;
    step.pause = policy_.min_interval;
  } else {
    step.pause = policy_.min_interval / 2;
  }
  return step;
}

bool StreamSession::emit(ChunkSink &sink, const std::string &jpeg) {
  const std::string header = stream::mjpeg_part_header(jpeg.size());
  if (!sink.write(header.data(), header.size()))
    return false;
  if (!sink.write(jpeg.data(), jpeg.size()))
    return false;
  if (!sink.write("\r\n", 2))
    return false;
  ++frames_sent_;
  bytes_sent_ += header.size() + jpeg.size() + 2;
  return true;
}

StreamSession::EndReason StreamSession::run(ChunkSink &sink) {
  try {
    while (gate_.accepting_streams()) {
      StreamStep step = next_step();
      if (step.payload && !emit(sink, *step.payload))
        return EndReason::ClientGone;
      if (!gate_.wait_for(step.pause))
        break;
    }
  } catch (const std::exception &e) {
    std::cerr << "[Stream] Session error: " << e.what() << "\n";
    return EndReason::ClientGone;
  }
  return EndReason::Shutdown;
}
