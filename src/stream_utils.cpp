#include "stream_utils.hpp"

#include <iostream>

#include "api_router.hpp"
#include "lifecycle_controller.hpp"

namespace stream {

std::string build_error_json(const std::string &msg,
                             const std::string &details) {
  std::string out = "{\"error\":\"" + json_escape(msg) + "\"";
  if (!details.empty())
    out += ",\"details\":\"" + json_escape(details) + "\"";
  out += "}";
  return out;
}

std::string json_string_or_null(const std::optional<std::string> &value) {
  if (!value)
    return "null";
  return "\"" + json_escape(*value) + "\"";
}

std::string status_message_json(const std::string &status,
                                const std::string &message) {
  return "{\"status\":\"" + json_escape(status) + "\",\"message\":\"" +
         json_escape(message) + "\"}";
}

bool HttpChunkSink::write(const char *data, size_t size) {
  if (!sink_.is_writable())
    return false;
  return sink_.write(data, size);
}

void serve_mjpeg(httplib::Response &res, LifecycleController &lifecycle,
                 PlaceholderRenderer &renderer, StreamPolicy policy,
                 std::function<void(bool)> on_done) {
  res.set_header("Connection", "close");
  res.set_header("Cache-Control", "no-cache, no-store, must-revalidate");
  res.set_chunked_content_provider(
      "multipart/x-mixed-replace; boundary=" + std::string(kMjpegBoundary),
      [&lifecycle, &renderer, policy](size_t, httplib::DataSink &sink) {
        StreamSession session(lifecycle.producer(), renderer, lifecycle.gate(),
                              policy);
        HttpChunkSink out(sink);
        const auto reason = session.run(out);
        std::cout << "[Stream] Client stream ended ("
                  << (reason == StreamSession::EndReason::ClientGone
                          ? "client gone"
                          : "shutdown")
                  << ") after " << session.frames_sent() << " frames, "
                  << session.bytes_sent() << " bytes" << std::endl;
        if (reason == StreamSession::EndReason::ClientGone)
          return false;
        sink.done();
        return true;
      },
      std::move(on_done));
}

} // namespace stream
