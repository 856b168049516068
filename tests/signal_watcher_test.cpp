#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <csignal>

#include "fake_camera.hpp"
#include "signal_watcher.hpp"

using namespace std::chrono_literals;

TEST(SignalWatcherTest, RunsHandlerOnceForFirstSignal) {
  std::atomic<int> calls{0};
  std::atomic<int> seen{0};
  SignalWatcher watcher({SIGUSR2}, [&](int sig) {
    seen = sig;
    ++calls;
  });
  EXPECT_FALSE(watcher.triggered());

  watcher.raise(SIGUSR2);
  ASSERT_TRUE(wait_until([&] { return calls.load() == 1; }));
  EXPECT_EQ(seen.load(), SIGUSR2);
  EXPECT_TRUE(watcher.triggered());
  EXPECT_EQ(watcher.signal(), SIGUSR2);

  watcher.stop();
  EXPECT_EQ(calls.load(), 1);
}

TEST(SignalWatcherTest, StopWithoutSignalSkipsHandler) {
  std::atomic<int> calls{0};
  const auto begin = std::chrono::steady_clock::now();
  {
    SignalWatcher watcher({SIGUSR2}, [&](int) { ++calls; });
    watcher.stop();
    watcher.stop();
    EXPECT_FALSE(watcher.triggered());
  }
  EXPECT_EQ(calls.load(), 0);
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
}
