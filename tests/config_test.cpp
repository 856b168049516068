#include <gtest/gtest.h>

#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include "config.hpp"

namespace {
ParseOutcome parse(std::vector<const char *> args, Config &cfg,
                   std::string &error) {
  args.insert(args.begin(), "rovercam");
  return parse_args(static_cast<int>(args.size()), args.data(), cfg, error);
}
} // namespace

TEST(ConfigTest, DefaultsMatchRoverSetup) {
  ::unsetenv("ROVERCAM_SMTP_PASSWORD");
  Config cfg;
  std::string error;
  ASSERT_EQ(parse({}, cfg, error), ParseOutcome::Ok);
  EXPECT_EQ(cfg.addr, "0.0.0.0");
  EXPECT_EQ(cfg.port, 5000);
  EXPECT_EQ(cfg.device, "video0");
  EXPECT_EQ(cfg.capture.width, 640);
  EXPECT_EQ(cfg.capture.height, 480);
  EXPECT_EQ(cfg.capture.fps, 20);
  EXPECT_EQ(cfg.capture.quality, 85);
  EXPECT_EQ(cfg.stream_fps, 30);
  EXPECT_EQ(cfg.relay_host, "localhost");
  EXPECT_EQ(cfg.relay_port, 9000);
  EXPECT_TRUE(cfg.enable_tunnel);
  EXPECT_EQ(cfg.smtp_port, 465);
  EXPECT_TRUE(cfg.smtp_password.empty());
}

TEST(ConfigTest, ParsesAllFlags) {
  Config cfg;
  std::string error;
  ASSERT_EQ(parse({"--addr", "127.0.0.1", "--port", "8081", "--device", "video2",
                   "--width", "320", "--height", "240", "--fps", "15",
                   "--quality", "70", "--stream-fps", "10", "--warmup-ms", "0",
                   "--relay-host", "10.0.0.5", "--relay-port", "9100",
                   "--no-tunnel", "--tunnel-timeout", "5", "--smtp-host",
                   "mail.example.com", "--smtp-port", "2465", "--email-from",
                   "rover@example.com", "--email-to", "a@example.com",
                   "--email-to", "b@example.com"},
                  cfg, error),
            ParseOutcome::Ok)
      << error;
  EXPECT_EQ(cfg.addr, "127.0.0.1");
  EXPECT_EQ(cfg.port, 8081);
  EXPECT_EQ(cfg.device, "video2");
  EXPECT_EQ(cfg.capture.width, 320);
  EXPECT_EQ(cfg.capture.height, 240);
  EXPECT_EQ(cfg.capture.fps, 15);
  EXPECT_EQ(cfg.capture.quality, 70);
  EXPECT_EQ(cfg.stream_fps, 10);
  EXPECT_EQ(cfg.warmup_ms, 0);
  EXPECT_EQ(cfg.relay_host, "10.0.0.5");
  EXPECT_EQ(cfg.relay_port, 9100);
  EXPECT_FALSE(cfg.enable_tunnel);
  EXPECT_EQ(cfg.tunnel_timeout_s, 5);
  EXPECT_EQ(cfg.smtp_host, "mail.example.com");
  EXPECT_EQ(cfg.smtp_port, 2465);
  EXPECT_EQ(cfg.email_from, "rover@example.com");
  const std::vector<std::string> to = {"a@example.com", "b@example.com"};
  EXPECT_EQ(cfg.email_to, to);
}

TEST(ConfigTest, HelpShortCircuits) {
  Config cfg;
  std::string error;
  EXPECT_EQ(parse({"--port", "1", "--help"}, cfg, error), ParseOutcome::Help);
  EXPECT_EQ(parse({"-h"}, cfg, error), ParseOutcome::Help);
}

TEST(ConfigTest, RejectsMalformedNumbers) {
  const std::vector<std::vector<const char *>> bad = {
      {"--port", "abc"},   {"--port", "80x"},      {"--port", "70000"},
      {"--quality", "0"},  {"--quality", "101"},   {"--fps", ""},
      {"--width", "-640"}, {"--relay-port", "99999999999"}};
  for (const auto &args : bad) {
    Config cfg;
    std::string error;
    EXPECT_EQ(parse(args, cfg, error), ParseOutcome::Error) << args[0] << " " << args[1];
    EXPECT_FALSE(error.empty());
  }
}

TEST(ConfigTest, RejectsMissingValueAndUnknownFlag) {
  Config cfg;
  std::string error;
  EXPECT_EQ(parse({"--port"}, cfg, error), ParseOutcome::Error);
  EXPECT_NE(error.find("--port"), std::string::npos);
  EXPECT_EQ(parse({"--email-to"}, cfg, error), ParseOutcome::Error);
  EXPECT_EQ(parse({"--bogus"}, cfg, error), ParseOutcome::Error);
  EXPECT_NE(error.find("--bogus"), std::string::npos);
}

TEST(ConfigTest, PasswordComesFromEnvironment) {
  ::setenv("ROVERCAM_SMTP_PASSWORD", "app-secret", 1);
  Config cfg;
  std::string error;
  ASSERT_EQ(parse({}, cfg, error), ParseOutcome::Ok);
  EXPECT_EQ(cfg.smtp_password, "app-secret");
  ::unsetenv("ROVERCAM_SMTP_PASSWORD");
}

TEST(ConfigTest, UsageListsFlags) {
  std::ostringstream os;
  print_usage(os);
  EXPECT_NE(os.str().find("--relay-host"), std::string::npos);
  EXPECT_NE(os.str().find("ROVERCAM_SMTP_PASSWORD"), std::string::npos);
}
