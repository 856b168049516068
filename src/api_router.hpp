#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include "httplib.h"

// Escapes `s` for use inside a JSON string literal.
inline std::string json_escape(const std::string &s) {
  static const char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(s.size());
  for (const unsigned char c : s) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
      out.push_back(static_cast<char>(c));
    } else if (c == '\n') {
      out.append("\\n");
    } else if (c == '\r') {
      out.append("\\r");
    } else if (c == '\t') {
      out.append("\\t");
    } else if (c < 0x20) {
      out.append("\\u00");
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0xF]);
    } else {
      out.push_back(static_cast<char>(c));
    }
  }
  return out;
}

struct Route {
  std::string path;   // e.g. "/api/control/{direction}"
  std::string method; // GET, POST
  httplib::Server::Handler handler;
};

class ApiRouter {
public:
  void add(std::string method, std::string path,
           httplib::Server::Handler handler) {
    routes_.push_back({std::move(path), std::move(method), std::move(handler)});
  }

  // "{name}" segments become "([^/]+)" captures, available as req.matches[i].
  static std::string to_pattern(const std::string &path) {
    std::string regex_path = path;
    size_t start_pos = 0;
    while ((start_pos = regex_path.find('{', start_pos)) != std::string::npos) {
      const size_t end_pos = regex_path.find('}', start_pos);
      if (end_pos == std::string::npos)
        break;
      regex_path.replace(start_pos, end_pos - start_pos + 1, "([^/]+)");
      start_pos += 7;
    }
    return regex_path;
  }

  void register_with(httplib::Server &svr) const {
    for (const auto &route : routes_) {
      const std::string pattern = to_pattern(route.path);
      std::cout << "[Router] " << route.method << " " << route.path
                << std::endl;
      if (route.method == "GET") {
        svr.Get(pattern, route.handler);
      } else if (route.method == "POST") {
        svr.Post(pattern, route.handler);
      } else {
        std::cerr << "[Router] Unsupported method " << route.method
                  << " for " << route.path << "\n";
      }
    }
  }

private:
  std::vector<Route> routes_;
};
