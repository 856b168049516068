#pragma once

#include <string>

struct CaptureParams {
  int width = 640;
  int height = 480;
  int fps = 20;
  int quality = 85; // JPEG quality, 1..100
};

enum class PixelFormat {
  MJPEG,
  YUYV,
  UNKNOWN
};

enum class CaptureState {
  Stopped,
  Starting,
  Running,
  Stopping
};

// Why a stream is serving the placeholder instead of live frames.
enum class OfflineReason {
  CapabilityMissing,
  DeviceOffline
};

inline const char *capture_state_label(CaptureState s) {
  switch (s) {
  case CaptureState::Stopped:
    return "stopped";
  case CaptureState::Starting:
    return "starting";
  case CaptureState::Running:
    return "running";
  case CaptureState::Stopping:
    return "stopping";
  }
  return "unknown";
}
