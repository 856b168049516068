#pragma once

#include <chrono>
#include <string>

namespace net {

// IPv4 address of the interface that routes to the internet. Falls back to
// 127.0.0.1 when there is no route.
std::string local_ip();

// True if a TCP connection to a public DNS server succeeds within `timeout`.
bool internet_available(std::chrono::milliseconds timeout);

// Resolves `host` and connects with a bounded wait. Returns a connected
// blocking socket, or -1 with `error` set ("timeout" when the deadline
// passed).
int connect_with_timeout(const std::string &host, int port,
                         std::chrono::milliseconds timeout, std::string &error);

} // namespace net
