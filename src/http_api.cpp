#include "http_api.hpp"

#include <functional>
#include <iostream>
#include <optional>
#include <sstream>

#include "api_router.hpp"
#include "index_html.hpp"
#include "stream_utils.hpp"

RoverApi::RoverApi(LifecycleController &lifecycle, MotorRelay &relay,
                   PlaceholderRenderer &renderer, StreamPolicy policy)
    : lifecycle_(lifecycle), relay_(relay), renderer_(renderer),
      policy_(policy), active_streams_(std::make_shared<std::atomic<int>>(0)) {}

void RoverApi::register_routes(httplib::Server &svr) {
  using namespace std::placeholders;
  ApiRouter router;
  router.add("GET", "/", std::bind(&RoverApi::handle_index, this, _1, _2));
  router.add("GET", "/video_feed",
             std::bind(&RoverApi::handle_video_feed, this, _1, _2));
  router.add("POST", "/api/control/{direction}",
             std::bind(&RoverApi::handle_control, this, _1, _2));
  router.add("GET", "/api/status",
             std::bind(&RoverApi::handle_status, this, _1, _2));
  router.add("GET", "/favicon.ico",
             [](const httplib::Request &, httplib::Response &res) {
               res.status = 204;
             });
  router.register_with(svr);

  svr.set_error_handler([](const httplib::Request &, httplib::Response &res) {
    if (!res.body.empty())
      return; // handler already wrote a structured error
    if (res.status == 404) {
      res.set_content(stream::build_error_json("not_found"),
                      "application/json");
    } else {
      res.set_content(stream::build_error_json("error"), "application/json");
    }
  });
}

void RoverApi::handle_index(const httplib::Request &, httplib::Response &res) {
  res.set_content(kIndexHtml, "text/html; charset=utf-8");
}

void RoverApi::handle_video_feed(const httplib::Request &req,
                                 httplib::Response &res) {
  if (!lifecycle_.accepting_streams()) {
    res.status = 503;
    res.set_content(stream::build_error_json("shutting_down"),
                    "application/json");
    return;
  }
  auto counter = active_streams_;
  const int now_active = counter->fetch_add(1) + 1;
  std::cout << "[Stream] Client " << req.remote_addr << " connected ("
            << now_active << " active)" << std::endl;
  stream::serve_mjpeg(res, lifecycle_, renderer_, policy_,
                      [counter](bool) { counter->fetch_sub(1); });
}

void RoverApi::handle_control(const httplib::Request &req,
                              httplib::Response &res) {
  res.set_header("Access-Control-Allow-Origin", "*");
  const std::string direction = req.matches.size() > 1 ? req.matches[1].str() : "";
  const auto command = MotorRelay::command_for_direction(direction);
  if (!command) {
    std::cerr << "[Relay] Invalid direction '" << direction << "'\n";
    res.status = 400;
    res.set_content(stream::status_message_json("error", "Invalid direction"),
                    "application/json");
    return;
  }
  const RelayResult result = relay_.send_command(*command);
  std::cout << "[Relay] '" << direction << "' -> '" << *command
            << "': " << result.message << std::endl;
  res.set_content(stream::status_message_json("success", result.message),
                  "application/json");
}

void RoverApi::handle_status(const httplib::Request &, httplib::Response &res) {
  res.set_header("Access-Control-Allow-Origin", "*");
  res.set_content(status_json(), "application/json");
}

std::string RoverApi::status_json() const {
  const CaptureProducer &producer = lifecycle_.producer();
  const CaptureParams params = producer.params();
  const LifecycleOptions &opts = lifecycle_.options();
  const bool relay_up = relay_.is_reachable();

  std::stringstream ss;
  ss << "{";
  ss << "\"camera_running\":" << (producer.running() ? "true" : "false") << ",";
  ss << "\"camera_available\":"
     << (producer.camera_available() ? "true" : "false") << ",";
  ss << "\"camera_resolution\":[" << params.width << "," << params.height
     << "],";
  ss << "\"camera_target_fps\":" << params.fps << ",";
  std::optional<std::string> fault;
  if (!producer.last_fault().empty())
    fault = producer.last_fault();
  ss << "\"camera_fault\":" << stream::json_string_or_null(fault) << ",";
  ss << "\"motor_controller_status\":\""
     << (relay_up ? "Connected" : "Disconnected") << "\",";
  ss << "\"motor_controller_target\":\"" << json_escape(relay_.target())
     << "\",";
  ss << "\"local_ip\":\"" << json_escape(opts.local_ip) << "\",";
  ss << "\"web_port\":" << opts.web_port << ",";
  ss << "\"tunnel_url\":" << stream::json_string_or_null(lifecycle_.tunnel_url())
     << ",";
  ss << "\"tunnel_active\":" << (lifecycle_.tunnel_active() ? "true" : "false")
     << ",";
  ss << "\"active_streams\":" << active_streams_->load();
  ss << "}";
  return ss.str();
}
