#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "types.hpp"

struct Config {
  std::string addr = "0.0.0.0";
  int port = 5000;
  std::string device = "video0";
  CaptureParams capture;
  int stream_fps = 30;
  int warmup_ms = 2000;
  std::string relay_host = "localhost";
  int relay_port = 9000;
  bool enable_tunnel = true;
  int tunnel_timeout_s = 30;
  std::string smtp_host = "smtp.gmail.com";
  int smtp_port = 465;
  std::string email_from;
  std::vector<std::string> email_to;
  std::string smtp_password; // from ROVERCAM_SMTP_PASSWORD
};

enum class ParseOutcome { Ok, Help, Error };

// Parses argv into `cfg`. On Error, `error` names the offending flag.
ParseOutcome parse_args(int argc, const char *const argv[], Config &cfg,
                        std::string &error);
void print_usage(std::ostream &os);
