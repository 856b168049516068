#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "httplib.h"
#include "lifecycle_controller.hpp"
#include "motor_relay.hpp"
#include "placeholder.hpp"
#include "stream_session.hpp"

// HTTP surface of the rover: control panel, video feed, control and status
// endpoints.
class RoverApi {
public:
  RoverApi(LifecycleController &lifecycle, MotorRelay &relay,
           PlaceholderRenderer &renderer, StreamPolicy policy);

  void register_routes(httplib::Server &svr);

  std::string status_json() const;
  int active_streams() const { return active_streams_->load(); }

private:
  void handle_index(const httplib::Request &req, httplib::Response &res);
  void handle_video_feed(const httplib::Request &req, httplib::Response &res);
  void handle_control(const httplib::Request &req, httplib::Response &res);
  void handle_status(const httplib::Request &req, httplib::Response &res);

  LifecycleController &lifecycle_;
  MotorRelay &relay_;
  PlaceholderRenderer &renderer_;
  StreamPolicy policy_;
  // Shared with response releasers, which can run after a handler returns.
  std::shared_ptr<std::atomic<int>> active_streams_;
};
