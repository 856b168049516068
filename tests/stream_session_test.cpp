#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "fake_camera.hpp"
#include "stream_session.hpp"

using namespace std::chrono_literals;

namespace {
// Records everything written; optionally rejects writes or closes the gate
// after a number of complete parts.
class RecordingSink : public ChunkSink {
public:
  bool write(const char *data, size_t size) override {
    std::lock_guard<std::mutex> lock(mu);
    if (fail_writes)
      return false;
    const std::string chunk(data, size);
    if (chunk.rfind("--frame\r\n", 0) == 0)
      part_times.push_back(std::chrono::steady_clock::now());
    bytes += chunk;
    if (chunk == "\r\n" && gate && ++parts_done >= close_after)
      gate->close();
    return true;
  }

  std::mutex mu;
  std::string bytes;
  std::vector<std::chrono::steady_clock::time_point> part_times;
  bool fail_writes = false;
  StreamGate *gate = nullptr;
  int close_after = 1;
  int parts_done = 0;
};

struct SessionFixture : public ::testing::Test {
  std::shared_ptr<FakeCameraState> camera = std::make_shared<FakeCameraState>();
  std::shared_ptr<FrameSlot> slot = std::make_shared<FrameSlot>();
  CaptureProducer producer{std::make_unique<FakeCameraProvider>(camera), slot,
                           fast_timing()};
  PlaceholderRenderer renderer{160, 120, 80};
  StreamGate gate;

  StreamPolicy policy() const {
    StreamPolicy p;
    p.min_interval = 40ms;
    p.offline_interval = 100ms;
    p.freshness = 1000ms;
    return p;
  }

  // Producer in Running state that never publishes on its own.
  void start_idle_producer() {
    camera->idle = true;
    ASSERT_TRUE(producer.start(CaptureParams{}));
  }
};
} // namespace

TEST(MjpegFraming, PartHeaderMatchesMultipartLayout) {
  EXPECT_EQ(stream::mjpeg_part_header(1234),
            "--frame\r\nContent-Type: image/jpeg\r\nContent-Length: 1234\r\n\r\n");
}

TEST(StreamPolicyTest, ForFpsDerivesMinimumInterval) {
  EXPECT_EQ(StreamPolicy::for_fps(30).min_interval, 33ms);
  EXPECT_EQ(StreamPolicy::for_fps(10).min_interval, 100ms);
  EXPECT_EQ(StreamPolicy::for_fps(0).min_interval, 1000ms);
}

TEST(StreamGateTest, CloseWakesWaiter) {
  StreamGate gate;
  EXPECT_TRUE(gate.accepting_streams());
  auto waiter = std::async(std::launch::async, [&] { return gate.wait_for(10s); });
  std::this_thread::sleep_for(50ms);
  const auto begin = std::chrono::steady_clock::now();
  gate.close();
  EXPECT_FALSE(waiter.get());
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 1s);
  EXPECT_FALSE(gate.accepting_streams());
  EXPECT_FALSE(gate.wait_for(10ms));
}

TEST_F(SessionFixture, StoppedProducerYieldsDeviceOfflinePlaceholder) {
  StreamSession session(producer, renderer, gate, policy());
  const StreamStep step = session.next_step();
  ASSERT_TRUE(step.payload);
  EXPECT_TRUE(step.placeholder);
  EXPECT_EQ(step.payload, renderer.image(OfflineReason::DeviceOffline));
  EXPECT_EQ(step.pause, 100ms);
}

TEST_F(SessionFixture, UnavailableProviderYieldsCapabilityMissingPlaceholder) {
  CaptureProducer unavailable(
      std::make_unique<UnavailableCameraProvider>("no camera"), slot,
      fast_timing());
  StreamSession session(unavailable, renderer, gate, policy());
  const StreamStep step = session.next_step();
  ASSERT_TRUE(step.payload);
  EXPECT_EQ(step.payload, renderer.image(OfflineReason::CapabilityMissing));
  EXPECT_NE(step.payload->find("Camera Lib Missing"), std::string::npos);
}

TEST_F(SessionFixture, FreshFrameIsEmittedAsIs) {
  start_idle_producer();
  slot->publish("fresh-jpeg", FrameSlot::Clock::now() - 200ms);
  StreamSession session(producer, renderer, gate, policy());
  const StreamStep step = session.next_step();
  ASSERT_TRUE(step.payload);
  EXPECT_FALSE(step.placeholder);
  EXPECT_EQ(*step.payload, "fresh-jpeg");
  EXPECT_EQ(step.pause, 40ms);
  producer.stop();
}

TEST_F(SessionFixture, StaleFrameIsNeverEmitted) {
  start_idle_producer();
  slot->publish("stale-jpeg", FrameSlot::Clock::now() - 1500ms);
  StreamSession session(producer, renderer, gate, policy());
  const StreamStep step = session.next_step();
  EXPECT_FALSE(step.payload);
  EXPECT_EQ(step.pause, 20ms);
  producer.stop();
}

TEST_F(SessionFixture, AbsentFrameSleepsHalfInterval) {
  start_idle_producer();
  StreamSession session(producer, renderer, gate, policy());
  const StreamStep step = session.next_step();
  EXPECT_FALSE(step.payload);
  EXPECT_EQ(step.pause, 20ms);
  producer.stop();
}

TEST_F(SessionFixture, EmitFramesPartAndCountsBytes) {
  RecordingSink sink;
  StreamSession session(producer, renderer, gate, policy());
  ASSERT_TRUE(session.emit(sink, "JPEGDATA"));
  EXPECT_EQ(sink.bytes,
            "--frame\r\nContent-Type: image/jpeg\r\nContent-Length: 8\r\n\r\n"
            "JPEGDATA\r\n");
  EXPECT_EQ(session.frames_sent(), 1u);
  EXPECT_EQ(session.bytes_sent(), sink.bytes.size());
}

TEST_F(SessionFixture, NeverStartedProducerStreamsPlaceholdersAtOfflinePace) {
  RecordingSink sink;
  sink.gate = &gate;
  sink.close_after = 3;
  StreamSession session(producer, renderer, gate, policy());

  EXPECT_EQ(session.run(sink), StreamSession::EndReason::Shutdown);
  ASSERT_EQ(sink.part_times.size(), 3u);
  for (size_t i = 1; i < sink.part_times.size(); ++i)
    EXPECT_GE(sink.part_times[i] - sink.part_times[i - 1], 95ms);

  const auto placeholder = renderer.image(OfflineReason::DeviceOffline);
  const std::string part = stream::mjpeg_part_header(placeholder->size()) +
                           *placeholder + "\r\n";
  EXPECT_EQ(sink.bytes, part + part + part);
}

TEST_F(SessionFixture, ClientGoneEndsRun) {
  RecordingSink sink;
  sink.fail_writes = true;
  StreamSession session(producer, renderer, gate, policy());
  EXPECT_EQ(session.run(sink), StreamSession::EndReason::ClientGone);
  EXPECT_EQ(session.frames_sent(), 0u);
  EXPECT_TRUE(gate.accepting_streams());
}

TEST_F(SessionFixture, ShutdownWakesSleepingSession) {
  StreamPolicy slow = policy();
  slow.offline_interval = 10s;
  RecordingSink sink;
  StreamSession session(producer, renderer, gate, slow);

  auto result = std::async(std::launch::async, [&] { return session.run(sink); });
  ASSERT_TRUE(wait_until([&] {
    std::lock_guard<std::mutex> lock(sink.mu);
    return !sink.part_times.empty();
  }));
  const auto begin = std::chrono::steady_clock::now();
  gate.close();
  EXPECT_EQ(result.get(), StreamSession::EndReason::Shutdown);
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 1s);
}

TEST_F(SessionFixture, ClosedGateEmitsNothing) {
  gate.close();
  RecordingSink sink;
  StreamSession session(producer, renderer, gate, policy());
  EXPECT_EQ(session.run(sink), StreamSession::EndReason::Shutdown);
  EXPECT_TRUE(sink.bytes.empty());
}

TEST_F(SessionFixture, LiveFramesReachTheStream) {
  ASSERT_TRUE(producer.start(CaptureParams{}));
  RecordingSink sink;
  sink.gate = &gate;
  sink.close_after = 2;
  StreamSession session(producer, renderer, gate, policy());
  EXPECT_EQ(session.run(sink), StreamSession::EndReason::Shutdown);
  const std::string part =
      stream::mjpeg_part_header(camera->frame.size()) + camera->frame + "\r\n";
  EXPECT_EQ(sink.bytes, part + part);
  producer.stop();
}
