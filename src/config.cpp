#include "config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace {
// std::stoi accepts trailing junk ("12abc"); reject it.
bool parse_int(const std::string &text, int lo, int hi, int &out) {
  try {
    size_t used = 0;
    const int v = std::stoi(text, &used);
    if (used != text.size() || v < lo || v > hi)
      return false;
    out = v;
    return true;
  } catch (const std::invalid_argument &) {
    return false;
  } catch (const std::out_of_range &) {
    return false;
  }
}
} // namespace

void print_usage(std::ostream &os) {
  os << "RoverCam\n"
     << "  --addr <ip>            Bind address (default 0.0.0.0)\n"
     << "  --port <port>          Bind port (default 5000)\n"
     << "  --device <name>        Camera node under /dev (default video0)\n"
     << "  --width <px>           Capture width (default 640)\n"
     << "  --height <px>          Capture height (default 480)\n"
     << "  --fps <n>              Capture frame rate (default 20)\n"
     << "  --quality <1-100>      JPEG quality (default 85)\n"
     << "  --stream-fps <n>       Max frames/s per viewer (default 30)\n"
     << "  --warmup-ms <ms>       Camera warm-up delay (default 2000)\n"
     << "  --relay-host <host>    Motor controller host (default localhost)\n"
     << "  --relay-port <port>    Motor controller port (default 9000)\n"
     << "  --no-tunnel            Do not start cloudflared\n"
     << "  --tunnel-timeout <s>   Seconds to wait for the tunnel URL (default 30)\n"
     << "  --smtp-host <host>     SMTPS server (default smtp.gmail.com)\n"
     << "  --smtp-port <port>     SMTPS port (default 465)\n"
     << "  --email-from <addr>    Sender address for the ready notification\n"
     << "  --email-to <addr>      Recipient (repeatable)\n"
     << "  --help                 Show this help\n"
     << "Environment: ROVERCAM_SMTP_PASSWORD sets the SMTP password.\n";
}

ParseOutcome parse_args(int argc, const char *const argv[], Config &cfg,
                        std::string &error) {
  struct IntFlag {
    const char *name;
    int *target;
    int lo;
    int hi;
  };
  const IntFlag int_flags[] = {
      {"--port", &cfg.port, 1, 65535},
      {"--width", &cfg.capture.width, 16, 8192},
      {"--height", &cfg.capture.height, 16, 8192},
      {"--fps", &cfg.capture.fps, 1, 240},
      {"--quality", &cfg.capture.quality, 1, 100},
      {"--stream-fps", &cfg.stream_fps, 1, 240},
      {"--warmup-ms", &cfg.warmup_ms, 0, 60000},
      {"--relay-port", &cfg.relay_port, 1, 65535},
      {"--tunnel-timeout", &cfg.tunnel_timeout_s, 1, 600},
      {"--smtp-port", &cfg.smtp_port, 1, 65535},
  };
  struct StringFlag {
    const char *name;
    std::string *target;
  };
  const StringFlag string_flags[] = {
      {"--addr", &cfg.addr},
      {"--device", &cfg.device},
      {"--relay-host", &cfg.relay_host},
      {"--smtp-host", &cfg.smtp_host},
      {"--email-from", &cfg.email_from},
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);
    if (arg == "--help" || arg == "-h")
      return ParseOutcome::Help;
    if (arg == "--no-tunnel") {
      cfg.enable_tunnel = false;
      continue;
    }

    bool matched = false;
    for (const auto &f : int_flags) {
      if (arg != f.name)
        continue;
      matched = true;
      if (i + 1 >= argc) {
        error = arg + " needs a value";
        return ParseOutcome::Error;
      }
      const std::string value(argv[++i]);
      if (!parse_int(value, f.lo, f.hi, *f.target)) {
        error = "invalid value for " + arg + ": " + value;
        return ParseOutcome::Error;
      }
      break;
    }
    for (const auto &f : string_flags) {
      if (matched || arg != f.name)
        continue;
      matched = true;
      if (i + 1 >= argc) {
        error = arg + " needs a value";
        return ParseOutcome::Error;
      }
      *f.target = argv[++i];
      break;
    }
    if (!matched && arg == "--email-to") {
      matched = true;
      if (i + 1 >= argc) {
        error = arg + " needs a value";
        return ParseOutcome::Error;
      }
      cfg.email_to.emplace_back(argv[++i]);
    }
    if (!matched) {
      error = "unknown option: " + arg;
      return ParseOutcome::Error;
    }
  }

  if (const char *pw = std::getenv("ROVERCAM_SMTP_PASSWORD"))
    cfg.smtp_password = pw;
  return ParseOutcome::Ok;
}
