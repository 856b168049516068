#include "email_notifier.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <utility>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include "net_utils.hpp"

namespace {
constexpr const char *kSubject = "Rover Control Panel Ready";

struct SslCtxDeleter {
  void operator()(SSL_CTX *ctx) const { SSL_CTX_free(ctx); }
};
struct SslDeleter {
  void operator()(SSL *ssl) const {
    SSL_shutdown(ssl);
    SSL_free(ssl);
  }
};

class FdGuard {
public:
  explicit FdGuard(int fd) : fd_(fd) {}
  ~FdGuard() {
    if (fd_ >= 0)
      ::close(fd_);
  }
  FdGuard(const FdGuard &) = delete;
  FdGuard &operator=(const FdGuard &) = delete;
  int get() const { return fd_; }

private:
  int fd_;
};

std::string ssl_error_string() {
  const unsigned long code = ERR_get_error();
  if (code == 0)
    return "TLS error";
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  return buf;
}

// Minimal SMTP dialogue over an established TLS session.
class SmtpSession {
public:
  explicit SmtpSession(SSL *ssl) : ssl_(ssl) {}

  bool write(const std::string &data, std::string &error) {
    size_t off = 0;
    while (off < data.size()) {
      const int n = SSL_write(ssl_, data.data() + off,
                              static_cast<int>(data.size() - off));
      if (n <= 0) {
        error = "write failed: " + ssl_error_string();
        return false;
      }
      off += static_cast<size_t>(n);
    }
    return true;
  }

  // Reads one (possibly multi-line) reply and returns its code, or -1.
  int read_reply(std::string &text, std::string &error) {
    text.clear();
    for (;;) {
      std::string line;
      if (!read_line(line, error))
        return -1;
      text += line + "\n";
      if (line.size() < 4 || line[3] != '-') {
        if (line.size() < 3) {
          error = "malformed reply: " + line;
          return -1;
        }
        return std::atoi(line.substr(0, 3).c_str());
      }
    }
  }

  bool command(const std::string &cmd, int expected, std::string &error) {
    if (!write(cmd + "\r\n", error))
      return false;
    return expect(expected, error);
  }

  bool expect(int expected, std::string &error) {
    std::string text;
    const int code = read_reply(text, error);
    if (code < 0)
      return false;
    if (code != expected) {
      error = "unexpected reply: " + text;
      return false;
    }
    return true;
  }

private:
  bool read_line(std::string &line, std::string &error) {
    for (;;) {
      const size_t pos = buf_.find("\r\n");
      if (pos != std::string::npos) {
        line = buf_.substr(0, pos);
        buf_.erase(0, pos + 2);
        return true;
      }
      char chunk[512];
      const int n = SSL_read(ssl_, chunk, sizeof(chunk));
      if (n <= 0) {
        error = "connection closed: " + ssl_error_string();
        return false;
      }
      buf_.append(chunk, static_cast<size_t>(n));
    }
  }

  SSL *ssl_;
  std::string buf_;
};
} // namespace

EmailNotifier::EmailNotifier(EmailSettings settings)
    : settings_(std::move(settings)) {}

bool EmailNotifier::configured() const {
  return !settings_.sender.empty() && !settings_.recipients.empty() &&
         !settings_.password.empty() && !settings_.smtp_host.empty();
}

std::string EmailNotifier::build_message(const std::string &access_url,
                                         const std::string &local_url) const {
  std::ostringstream to;
  for (size_t i = 0; i < settings_.recipients.size(); ++i) {
    if (i)
      to << ", ";
    to << settings_.recipients[i];
  }
  std::ostringstream msg;
  msg << "From: " << settings_.sender << "\r\n";
  msg << "To: " << to.str() << "\r\n";
  msg << "Subject: " << kSubject << "\r\n";
  msg << "MIME-Version: 1.0\r\n";
  msg << "Content-Type: text/plain; charset=utf-8\r\n";
  msg << "\r\n";
  msg << "The Rover Control Panel is accessible at:\r\n";
  msg << access_url << "\r\n\r\n";
  msg << "If the above is a tunnel URL and stops working, try the local "
         "address (same network only):\r\n";
  msg << local_url << "\r\n";
  return msg.str();
}

std::string EmailNotifier::dot_stuff(const std::string &message) {
  std::string out;
  out.reserve(message.size() + 8);
  bool line_start = true;
  for (char c : message) {
    if (line_start && c == '.')
      out += '.';
    out += c;
    line_start = (c == '\n');
  }
  return out;
}

std::string EmailNotifier::base64(const std::string &in) {
  std::string out(4 * ((in.size() + 2) / 3) + 1, '\0');
  const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                                reinterpret_cast<const unsigned char *>(in.data()),
                                static_cast<int>(in.size()));
  out.resize(n > 0 ? static_cast<size_t>(n) : 0);
  return out;
}

bool EmailNotifier::notify(const std::string &access_url,
                           const std::string &local_url) {
  if (!configured()) {
    std::cerr << "[Email] Sender, recipients or password not set; skipping "
                 "notification\n";
    return false;
  }
  std::string error;
  if (!send(build_message(access_url, local_url), error)) {
    std::cerr << "[Email] Failed to send notification: " << error << "\n";
    return false;
  }
  std::cout << "[Email] Notification sent to " << settings_.recipients.size()
            << " recipient(s)" << std::endl;
  return true;
}

bool EmailNotifier::send(const std::string &message, std::string &error) {
  FdGuard fd(net::connect_with_timeout(settings_.smtp_host,
                                       settings_.smtp_port,
                                       std::chrono::seconds(10), error));
  if (fd.get() < 0)
    return false;
  timeval tv{10, 0};
  if (::setsockopt(fd.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
      ::setsockopt(fd.get(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
    std::cerr << "[Email] Could not set socket timeouts\n";
  }

  std::unique_ptr<SSL_CTX, SslCtxDeleter> ctx(SSL_CTX_new(TLS_client_method()));
  if (!ctx) {
    error = ssl_error_string();
    return false;
  }
  SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
  if (SSL_CTX_set_default_verify_paths(ctx.get()) != 1) {
    error = "cannot load CA certificates: " + ssl_error_string();
    return false;
  }

  std::unique_ptr<SSL, SslDeleter> ssl(SSL_new(ctx.get()));
  if (!ssl) {
    error = ssl_error_string();
    return false;
  }
  if (SSL_set_fd(ssl.get(), fd.get()) != 1 ||
      SSL_set_tlsext_host_name(ssl.get(), settings_.smtp_host.c_str()) != 1 ||
      SSL_set1_host(ssl.get(), settings_.smtp_host.c_str()) != 1) {
    error = "TLS setup failed: " + ssl_error_string();
    return false;
  }
  if (SSL_connect(ssl.get()) != 1) {
    error = "TLS handshake failed: " + ssl_error_string();
    return false;
  }

  SmtpSession smtp(ssl.get());
  if (!smtp.expect(220, error))
    return false;
  if (!smtp.command("EHLO rovercam", 250, error))
    return false;
  if (!smtp.command("AUTH LOGIN", 334, error))
    return false;
  if (!smtp.command(base64(settings_.sender), 334, error))
    return false;
  if (!smtp.command(base64(settings_.password), 235, error)) {
    error = "authentication failed (check sender and password): " + error;
    return false;
  }
  if (!smtp.command("MAIL FROM:<" + settings_.sender + ">", 250, error))
    return false;
  for (const auto &rcpt : settings_.recipients) {
    if (!smtp.command("RCPT TO:<" + rcpt + ">", 250, error))
      return false;
  }
  if (!smtp.command("DATA", 354, error))
    return false;
  if (!smtp.command(dot_stuff(message) + ".", 250, error))
    return false;
  std::string quit_error;
  if (!smtp.command("QUIT", 221, quit_error))
    std::cerr << "[Email] QUIT not acknowledged: " << quit_error << "\n";
  return true;
}
