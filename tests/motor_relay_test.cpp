#include <gtest/gtest.h>

#include "fake_camera.hpp"
#include "loopback_listener.hpp"
#include "motor_relay.hpp"

TEST(MotorRelayTest, MapsDirectionsCaseInsensitively) {
  EXPECT_EQ(MotorRelay::command_for_direction("up"), 'F');
  EXPECT_EQ(MotorRelay::command_for_direction("DOWN"), 'B');
  EXPECT_EQ(MotorRelay::command_for_direction("Left"), 'L');
  EXPECT_EQ(MotorRelay::command_for_direction("right"), 'R');
  EXPECT_EQ(MotorRelay::command_for_direction("sToP"), 'S');
  EXPECT_FALSE(MotorRelay::command_for_direction("xyz").has_value());
  EXPECT_FALSE(MotorRelay::command_for_direction("").has_value());
  EXPECT_FALSE(MotorRelay::command_for_direction("upp").has_value());
}

TEST(MotorRelayTest, SendsExactlyOneByte) {
  LoopbackListener listener;
  MotorRelay relay("127.0.0.1", listener.port());
  const RelayResult result = relay.send_command('F');
  EXPECT_TRUE(result.ok);
  EXPECT_EQ(result.message, "Command 'F' sent to motor controller.");
  ASSERT_TRUE(wait_until([&] { return !listener.received().empty(); }));
  EXPECT_EQ(listener.received().front(), "F");
}

TEST(MotorRelayTest, RefusedConnectionIsStructuredFailure) {
  MotorRelay relay("127.0.0.1", LoopbackListener::closed_port());
  const RelayResult result = relay.send_command('S');
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.message.rfind("Socket error sending 'S': ", 0), 0u)
      << result.message;
}

TEST(MotorRelayTest, UnresolvableHostIsStructuredFailure) {
  MotorRelay relay("no-such-host.invalid", 9000);
  const RelayResult result = relay.send_command('L');
  EXPECT_FALSE(result.ok);
  EXPECT_FALSE(result.message.empty());
}

TEST(MotorRelayTest, ReachabilityProbe) {
  LoopbackListener listener;
  MotorRelay relay("localhost", listener.port());
  EXPECT_TRUE(relay.is_reachable());
  EXPECT_EQ(relay.target(), "localhost:" + std::to_string(listener.port()));

  MotorRelay dead("127.0.0.1", LoopbackListener::closed_port());
  EXPECT_FALSE(dead.is_reachable());
}
