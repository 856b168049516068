#pragma once

#include <functional>
#include <optional>
#include <string>

#include "httplib.h"
#include "stream_session.hpp"

class LifecycleController;

namespace stream {

// JSON helpers
std::string build_error_json(const std::string &msg,
                             const std::string &details = "");
std::string json_string_or_null(const std::optional<std::string> &value);
std::string status_message_json(const std::string &status,
                                const std::string &message);

// Adapts httplib's DataSink to ChunkSink.
class HttpChunkSink : public ChunkSink {
public:
  explicit HttpChunkSink(httplib::DataSink &sink) : sink_(sink) {}
  bool write(const char *data, size_t size) override;

private:
  httplib::DataSink &sink_;
};

// Streaming responder: runs one StreamSession on the connection's worker
// thread until the client leaves or streams close. `on_done` runs once the
// response is released.
void serve_mjpeg(httplib::Response &res, LifecycleController &lifecycle,
                 PlaceholderRenderer &renderer, StreamPolicy policy,
                 std::function<void(bool)> on_done);

} // namespace stream
