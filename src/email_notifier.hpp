#pragma once

#include <string>
#include <vector>

struct EmailSettings {
  std::string smtp_host = "smtp.gmail.com";
  int smtp_port = 465;
  std::string sender;
  std::vector<std::string> recipients;
  std::string password;
};

// Sends the "server is up" mail over SMTPS (implicit TLS) with AUTH LOGIN.
class EmailNotifier {
public:
  explicit EmailNotifier(EmailSettings settings);

  bool configured() const;
  // RFC 5322 message with CRLF line endings, not yet dot-stuffed.
  std::string build_message(const std::string &access_url,
                            const std::string &local_url) const;
  // Logs and returns false on any failure; never throws.
  bool notify(const std::string &access_url, const std::string &local_url);

  static std::string dot_stuff(const std::string &message);
  static std::string base64(const std::string &in);

private:
  bool send(const std::string &message, std::string &error);

  EmailSettings settings_;
};
