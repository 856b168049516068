#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>

#include "fake_camera.hpp"
#include "server_runner.hpp"

using namespace std::chrono_literals;

TEST(ServerRunnerTest, StopBeforeRunReturnsImmediately) {
  httplib::Server svr;
  ASSERT_GT(svr.bind_to_any_port("127.0.0.1"), 0);
  ServerRunner runner(svr);
  runner.request_stop();
  auto served = std::async(std::launch::async, [&] { return runner.run(); });
  ASSERT_EQ(served.wait_for(2s), std::future_status::ready);
  EXPECT_TRUE(served.get());
  EXPECT_FALSE(svr.is_running());
}

// A stop that lands between run() starting and the accept loop coming up
// must not be lost.
TEST(ServerRunnerTest, StopRightAfterRunStartsIsNotLost) {
  for (int i = 0; i < 20; ++i) {
    httplib::Server svr;
    ASSERT_GT(svr.bind_to_any_port("127.0.0.1"), 0);
    ServerRunner runner(svr);
    auto served = std::async(std::launch::async, [&] { return runner.run(); });
    runner.request_stop();
    ASSERT_EQ(served.wait_for(3s), std::future_status::ready) << "round " << i;
    served.get();
  }
}

TEST(ServerRunnerTest, StopsServingServer) {
  httplib::Server svr;
  svr.Get("/ping", [](const httplib::Request &, httplib::Response &res) {
    res.set_content("pong", "text/plain");
  });
  const int port = svr.bind_to_any_port("127.0.0.1");
  ASSERT_GT(port, 0);
  ServerRunner runner(svr);
  auto served = std::async(std::launch::async, [&] { return runner.run(); });
  ASSERT_TRUE(wait_until([&] { return svr.is_running(); }));

  httplib::Client cli("127.0.0.1", port);
  auto res = cli.Get("/ping");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->body, "pong");

  runner.request_stop();
  runner.request_stop();
  ASSERT_EQ(served.wait_for(3s), std::future_status::ready);
  EXPECT_TRUE(served.get());
}
