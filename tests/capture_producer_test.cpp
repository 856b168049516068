#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "capture_producer.hpp"
#include "fake_camera.hpp"
#include "jpeg_encoder.hpp"

using namespace std::chrono_literals;

namespace {
struct ProducerFixture : public ::testing::Test {
  std::shared_ptr<FakeCameraState> camera = std::make_shared<FakeCameraState>();
  std::shared_ptr<FrameSlot> slot = std::make_shared<FrameSlot>();

  std::unique_ptr<CaptureProducer>
  make_producer(CaptureProducer::Timing timing = fast_timing()) {
    return std::make_unique<CaptureProducer>(
        std::make_unique<FakeCameraProvider>(camera), slot, timing);
  }
};
} // namespace

TEST_F(ProducerFixture, StartPublishesFrames) {
  auto producer = make_producer();
  ASSERT_TRUE(producer->start(CaptureParams{}));
  EXPECT_EQ(producer->state(), CaptureState::Running);
  EXPECT_TRUE(producer->running());
  ASSERT_TRUE(wait_until([&] { return slot->read().has_value(); }));
  EXPECT_EQ(*slot->read()->bytes, camera->frame);
  producer->stop();
}

TEST_F(ProducerFixture, StopReleasesDeviceOnceAndClearsSlot) {
  auto producer = make_producer();
  ASSERT_TRUE(producer->start(CaptureParams{}));
  ASSERT_TRUE(wait_until([&] { return slot->read().has_value(); }));

  producer->stop();
  EXPECT_EQ(producer->state(), CaptureState::Stopped);
  EXPECT_EQ(camera->release_calls.load(), 1);
  EXPECT_FALSE(slot->read().has_value());
}

TEST_F(ProducerFixture, StopTwiceEqualsStopOnce) {
  auto producer = make_producer();
  ASSERT_TRUE(producer->start(CaptureParams{}));
  producer->stop();
  producer->stop();
  EXPECT_EQ(producer->state(), CaptureState::Stopped);
  EXPECT_EQ(camera->release_calls.load(), 1);
  EXPECT_FALSE(slot->read().has_value());
}

TEST_F(ProducerFixture, StopWithoutStartIsHarmless) {
  auto producer = make_producer();
  producer->stop();
  EXPECT_EQ(producer->state(), CaptureState::Stopped);
  EXPECT_EQ(camera->opens.load(), 0);
  EXPECT_EQ(camera->release_calls.load(), 0);
}

TEST_F(ProducerFixture, StartWhileRunningIsNoop) {
  auto producer = make_producer();
  ASSERT_TRUE(producer->start(CaptureParams{}));
  EXPECT_TRUE(producer->start(CaptureParams{}));
  EXPECT_EQ(camera->opens.load(), 1);
  producer->stop();
}

TEST_F(ProducerFixture, RestartOpensDeviceAgain) {
  auto producer = make_producer();
  ASSERT_TRUE(producer->start(CaptureParams{}));
  producer->stop();
  ASSERT_TRUE(producer->start(CaptureParams{}));
  EXPECT_EQ(camera->opens.load(), 2);
  producer->stop();
  EXPECT_EQ(camera->release_calls.load(), 2);
}

TEST_F(ProducerFixture, UnavailableProviderCannotStart) {
  CaptureProducer producer(
      std::make_unique<UnavailableCameraProvider>("no V4L2 device"), slot,
      fast_timing());
  EXPECT_FALSE(producer.camera_available());
  EXPECT_FALSE(producer.start(CaptureParams{}));
  EXPECT_EQ(producer.state(), CaptureState::Stopped);
  EXPECT_EQ(producer.camera_description(), "no V4L2 device");
}

TEST_F(ProducerFixture, OpenFailureLeavesStoppedWithoutLeak) {
  camera->fail_open = true;
  auto producer = make_producer();
  EXPECT_FALSE(producer->start(CaptureParams{}));
  EXPECT_EQ(producer->state(), CaptureState::Stopped);
  EXPECT_EQ(camera->release_calls.load(), 1);
  EXPECT_NE(producer->last_fault().find("fake open failure"), std::string::npos);
  producer->stop();
  EXPECT_EQ(camera->release_calls.load(), 1);
}

TEST_F(ProducerFixture, GrabFaultStopsProducerAndReleasesDevice) {
  auto producer = make_producer();
  ASSERT_TRUE(producer->start(CaptureParams{}));
  ASSERT_TRUE(wait_until([&] { return slot->read().has_value(); }));

  camera->fail_grab = true;
  ASSERT_TRUE(wait_until(
      [&] { return producer->state() == CaptureState::Stopped; }));
  EXPECT_EQ(camera->release_calls.load(), 1);
  EXPECT_FALSE(slot->read().has_value());
  EXPECT_NE(producer->last_fault().find("fake grab failure"), std::string::npos);

  producer->stop();
  EXPECT_EQ(camera->release_calls.load(), 1);
}

TEST_F(ProducerFixture, RecoversAfterFault) {
  auto producer = make_producer();
  ASSERT_TRUE(producer->start(CaptureParams{}));
  camera->fail_grab = true;
  ASSERT_TRUE(wait_until(
      [&] { return producer->state() == CaptureState::Stopped; }));

  camera->fail_grab = false;
  ASSERT_TRUE(producer->start(CaptureParams{}));
  EXPECT_TRUE(producer->last_fault().empty());
  ASSERT_TRUE(wait_until([&] { return slot->read().has_value(); }));
  producer->stop();
}

TEST_F(ProducerFixture, StopIsBoundedWhenGrabIsWedged) {
  camera->wedge = true;
  CaptureProducer::Timing timing = fast_timing();
  timing.stop_timeout = 200ms;
  auto producer = make_producer(timing);
  ASSERT_TRUE(producer->start(CaptureParams{}));
  ASSERT_TRUE(wait_until([&] { return camera->grabs.load() > 0; }));

  const auto begin = std::chrono::steady_clock::now();
  producer->stop();
  const auto elapsed = std::chrono::steady_clock::now() - begin;
  EXPECT_LT(elapsed, 1500ms);
  EXPECT_EQ(producer->state(), CaptureState::Stopped);
  EXPECT_EQ(camera->release_calls.load(), 1);
  EXPECT_FALSE(slot->read().has_value());

  // Let the abandoned thread finish; it must not publish, release again or
  // log.
  testing::internal::CaptureStdout();
  camera->unwedge();
  ASSERT_TRUE(wait_until([&] { return camera->unwedged_grabs.load() == 1; }));
  std::this_thread::sleep_for(100ms);
  const std::string out = testing::internal::GetCapturedStdout();
  EXPECT_EQ(out.find("[Capture]"), std::string::npos) << out;
  EXPECT_EQ(camera->release_calls.load(), 1);
  EXPECT_FALSE(slot->read().has_value());
}

TEST_F(ProducerFixture, StopDuringWarmupAbortsStart) {
  CaptureProducer::Timing timing = fast_timing();
  timing.warmup = 10s;
  auto producer = make_producer(timing);

  auto started = std::async(std::launch::async,
                            [&] { return producer->start(CaptureParams{}); });
  ASSERT_TRUE(wait_until([&] { return camera->opens.load() == 1; }));
  std::this_thread::sleep_for(50ms);

  const auto begin = std::chrono::steady_clock::now();
  producer->stop();
  EXPECT_FALSE(started.get());
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
  EXPECT_EQ(producer->state(), CaptureState::Stopped);
  EXPECT_EQ(camera->release_calls.load(), 1);
}

TEST_F(ProducerFixture, YuyvFramesAreEncodedToJpeg) {
  CaptureParams params;
  params.width = 32;
  params.height = 16;
  camera->format = PixelFormat::YUYV;
  camera->frame.assign(static_cast<size_t>(params.width) * params.height * 2,
                       '\x80');
  auto producer = make_producer();
  ASSERT_TRUE(producer->start(params));
  ASSERT_TRUE(wait_until([&] { return slot->read().has_value(); }));
  EXPECT_TRUE(looks_like_jpeg(*slot->read()->bytes));
  EXPECT_EQ(producer->params().width, 32);
  producer->stop();
}

TEST_F(ProducerFixture, PaddedYuyvRowsUseDriverPitch) {
  CaptureParams params;
  params.width = 32;
  params.height = 16;
  const int pitch = params.width * 2 + 64;
  camera->format = PixelFormat::YUYV;
  camera->bytes_per_line = pitch;
  // Visible pixels mid-gray, padding bytes black.
  camera->frame.assign(static_cast<size_t>(pitch) * params.height, '\0');
  for (int y = 0; y < params.height; ++y)
    camera->frame.replace(static_cast<size_t>(y) * pitch, params.width * 2,
                          params.width * 2, '\x80');

  std::string packed(static_cast<size_t>(params.width) * params.height * 2,
                     '\x80');
  std::string expected;
  std::string error;
  ASSERT_TRUE(encode_yuyv_jpeg(reinterpret_cast<const uint8_t *>(packed.data()),
                               params.width, params.height, params.quality,
                               expected, error));

  auto producer = make_producer();
  ASSERT_TRUE(producer->start(params));
  ASSERT_TRUE(wait_until([&] { return slot->read().has_value(); }));
  EXPECT_EQ(*slot->read()->bytes, expected);
  producer->stop();
}

TEST_F(ProducerFixture, DestructorStopsRunningProducer) {
  {
    auto producer = make_producer();
    ASSERT_TRUE(producer->start(CaptureParams{}));
  }
  EXPECT_EQ(camera->release_calls.load(), 1);
  EXPECT_FALSE(slot->read().has_value());
}
