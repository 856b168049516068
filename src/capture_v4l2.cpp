#include "capture_v4l2.hpp"

#include <algorithm>
#include <iostream>

#ifdef __linux__
#include <errno.h>
#include <fcntl.h>
#include <linux/videodev2.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <sys/select.h>
#include <unistd.h>

#include <filesystem>

namespace {
bool xioctl(int fd, unsigned long request, void *arg) {
  int r;
  do {
    r = ioctl(fd, request, arg);
  } while (r == -1 && errno == EINTR);
  return r != -1;
}

PixelFormat v4l2_to_pixel_format(__u32 fmt) {
  switch (fmt) {
  case V4L2_PIX_FMT_MJPEG:
  case V4L2_PIX_FMT_JPEG:
    return PixelFormat::MJPEG;
  case V4L2_PIX_FMT_YUYV:
    return PixelFormat::YUYV;
  default:
    return PixelFormat::UNKNOWN;
  }
}

std::string fourcc_to_string(__u32 fmt) {
  char fourcc[5] = {static_cast<char>(fmt & 0xFF),
                    static_cast<char>((fmt >> 8) & 0xFF),
                    static_cast<char>((fmt >> 16) & 0xFF),
                    static_cast<char>((fmt >> 24) & 0xFF), 0};
  return std::string(fourcc);
}

std::string device_path(const std::string &device_id) {
  return device_id.rfind("/dev/", 0) == 0 ? device_id : "/dev/" + device_id;
}

std::string errno_text(const char *what) {
  return std::string(what) + " failed: " + strerror(errno);
}

__u32 effective_caps(const v4l2_capability &cap) {
  // device_caps describes this node; capabilities covers the whole device.
  return (cap.capabilities & V4L2_CAP_DEVICE_CAPS) ? cap.device_caps
                                                   : cap.capabilities;
}

// Poll window for one grab. Keeps stop() responsive.
constexpr long kGrabTimeoutUsec = 100000;
} // namespace

std::vector<std::string> list_capture_devices() {
  std::vector<std::string> devices;
  std::error_code ec;
  for (const auto &entry : std::filesystem::directory_iterator("/dev", ec)) {
    const auto name = entry.path().filename().string();
    if (name.rfind("video", 0) != 0)
      continue;
    int fd = ::open(entry.path().c_str(), O_RDWR | O_NONBLOCK, 0);
    if (fd < 0)
      continue;
    v4l2_capability cap{};
    if (xioctl(fd, VIDIOC_QUERYCAP, &cap) &&
        (effective_caps(cap) & V4L2_CAP_VIDEO_CAPTURE)) {
      devices.push_back(name);
    }
    ::close(fd);
  }
  std::sort(devices.begin(), devices.end());
  return devices;
}

std::unique_ptr<CameraProvider>
probe_camera_provider(const std::string &device_id) {
  const std::string path = device_path(device_id);
  int fd = ::open(path.c_str(), O_RDWR | O_NONBLOCK, 0);
  if (fd < 0) {
    std::string reason = "cannot open " + path + ": " + strerror(errno);
    const auto others = list_capture_devices();
    if (!others.empty()) {
      reason += " (capture devices present:";
      for (const auto &d : others)
        reason += " " + d;
      reason += ")";
    }
    return std::make_unique<UnavailableCameraProvider>(reason);
  }
  v4l2_capability cap{};
  if (!xioctl(fd, VIDIOC_QUERYCAP, &cap)) {
    const std::string reason = path + ": " + errno_text("VIDIOC_QUERYCAP");
    ::close(fd);
    return std::make_unique<UnavailableCameraProvider>(reason);
  }
  ::close(fd);
  if (!(effective_caps(cap) & V4L2_CAP_VIDEO_CAPTURE)) {
    return std::make_unique<UnavailableCameraProvider>(
        path + " does not support video capture");
  }
  return std::make_unique<V4l2CameraProvider>(
      device_id, reinterpret_cast<const char *>(cap.card));
}

CaptureV4L2::CaptureV4L2(std::string device_id)
    : device_id_(std::move(device_id)) {}

CaptureV4L2::~CaptureV4L2() { release(); }

void CaptureV4L2::cleanup_mmap_buffers() {
  for (unsigned i = 0; i < num_buffers_; ++i) {
    if (buffers_[i].start && buffers_[i].start != MAP_FAILED) {
      munmap(buffers_[i].start, buffers_[i].length);
    }
  }
  for (unsigned i = 0; i < kNumBuffers; ++i) {
    buffers_[i].start = nullptr;
    buffers_[i].length = 0;
  }
  num_buffers_ = 0;
}

void CaptureV4L2::cleanup_mmap_setup_failure(int fd) {
  if (!use_mmap_) {
    return;
  }
  v4l2_buf_type type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  xioctl(fd, VIDIOC_STREAMOFF, &type);
  cleanup_mmap_buffers();

  v4l2_requestbuffers req{};
  req.count = 0;
  req.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  req.memory = V4L2_MEMORY_MMAP;
  xioctl(fd, VIDIOC_REQBUFS, &req);
}

bool CaptureV4L2::negotiate_format(int fd, CaptureParams &params,
                                   std::string &error) {
  // Prefer compressed frames straight from the sensor; fall back to YUYV and
  // encode on our side.
  for (__u32 pixfmt : {V4L2_PIX_FMT_MJPEG, V4L2_PIX_FMT_YUYV}) {
    v4l2_format fmt{};
    fmt.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    fmt.fmt.pix.width = params.width;
    fmt.fmt.pix.height = params.height;
    fmt.fmt.pix.pixelformat = pixfmt;
    fmt.fmt.pix.field = V4L2_FIELD_ANY;
    if (!xioctl(fd, VIDIOC_S_FMT, &fmt)) {
      std::cerr << "[Capture] VIDIOC_S_FMT(" << fourcc_to_string(pixfmt)
                << ") failed; errno=" << errno << "\n";
      continue;
    }
    const PixelFormat got = v4l2_to_pixel_format(fmt.fmt.pix.pixelformat);
    if (got == PixelFormat::UNKNOWN) {
      std::cerr << "[Capture] Asked for " << fourcc_to_string(pixfmt)
                << ", driver negotiated "
                << fourcc_to_string(fmt.fmt.pix.pixelformat) << "\n";
      continue;
    }
    pixel_format_ = got;
    params.width = static_cast<int>(fmt.fmt.pix.width);
    params.height = static_cast<int>(fmt.fmt.pix.height);
    frame_size_ = fmt.fmt.pix.sizeimage;
    bytes_per_line_ = static_cast<int>(fmt.fmt.pix.bytesperline);
    std::cerr << "[Capture] Format set: " << params.width << "x"
              << params.height
              << " fourcc=" << fourcc_to_string(fmt.fmt.pix.pixelformat)
              << "\n";
    return true;
  }
  error = "device offers neither MJPEG nor YUYV";
  return false;
}

void CaptureV4L2::apply_jpeg_quality(int fd, CaptureParams &params) {
  params.quality = std::clamp(params.quality, 1, 100);
  if (pixel_format_ != PixelFormat::MJPEG)
    return; // encoded in software at params.quality

  v4l2_control ctrl{};
  ctrl.id = V4L2_CID_JPEG_COMPRESSION_QUALITY;
  ctrl.value = params.quality;
  if (xioctl(fd, VIDIOC_S_CTRL, &ctrl)) {
    v4l2_control get{};
    get.id = V4L2_CID_JPEG_COMPRESSION_QUALITY;
    if (xioctl(fd, VIDIOC_G_CTRL, &get))
      params.quality = get.value;
    std::cerr << "[Capture] MJPEG quality set to " << params.quality
              << " via JPEG control\n";
    return;
  }

  // Older UVC/gspca drivers only expose the legacy JPEGCOMP ioctls.
  v4l2_jpegcompression comp{};
  if (xioctl(fd, VIDIOC_G_JPEGCOMP, &comp)) {
    comp.quality = params.quality;
    if (xioctl(fd, VIDIOC_S_JPEGCOMP, &comp)) {
      if (xioctl(fd, VIDIOC_G_JPEGCOMP, &comp))
        params.quality = comp.quality;
      std::cerr << "[Capture] MJPEG quality set to " << params.quality
                << " via JPEGCOMP\n";
      return;
    }
  }
  std::cerr << "[Capture] Driver has no JPEG quality control; using its "
               "default\n";
}

void CaptureV4L2::apply_frame_rate(int fd, CaptureParams &params) {
  v4l2_streamparm sp{};
  sp.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  sp.parm.capture.timeperframe.numerator = 1;
  sp.parm.capture.timeperframe.denominator = std::max(1, params.fps);
  xioctl(fd, VIDIOC_S_PARM, &sp); // best effort
  if (xioctl(fd, VIDIOC_G_PARM, &sp)) {
    const auto num = sp.parm.capture.timeperframe.numerator;
    const auto den = sp.parm.capture.timeperframe.denominator;
    if (num > 0 && den > 0) {
      const int fps = static_cast<int>(den / num);
      if (fps > 0) {
        params.fps = fps;
      }
    }
  }
}

bool CaptureV4L2::setup_mmap(int fd, std::string &error) {
  v4l2_requestbuffers req{};
  req.count = kNumBuffers;
  req.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  req.memory = V4L2_MEMORY_MMAP;
  if (!xioctl(fd, VIDIOC_REQBUFS, &req) || req.count < 2) {
    error = errno_text("VIDIOC_REQBUFS");
    cleanup_mmap_setup_failure(fd);
    return false;
  }

  for (unsigned i = 0; i < req.count && i < kNumBuffers; ++i) {
    v4l2_buffer buf{};
    buf.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    buf.memory = V4L2_MEMORY_MMAP;
    buf.index = i;
    if (!xioctl(fd, VIDIOC_QUERYBUF, &buf)) {
      error = errno_text("VIDIOC_QUERYBUF");
      cleanup_mmap_setup_failure(fd);
      return false;
    }
    buffers_[i].length = buf.length;
    buffers_[i].start = mmap(nullptr, buf.length, PROT_READ | PROT_WRITE,
                             MAP_SHARED, fd, buf.m.offset);
    if (buffers_[i].start == MAP_FAILED) {
      error = errno_text("mmap");
      cleanup_mmap_setup_failure(fd);
      return false;
    }
    num_buffers_++;
  }

  for (unsigned i = 0; i < num_buffers_; ++i) {
    v4l2_buffer buf{};
    buf.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    buf.memory = V4L2_MEMORY_MMAP;
    buf.index = i;
    if (!xioctl(fd, VIDIOC_QBUF, &buf)) {
      error = errno_text("VIDIOC_QBUF");
      cleanup_mmap_setup_failure(fd);
      return false;
    }
  }

  v4l2_buf_type type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  if (!xioctl(fd, VIDIOC_STREAMON, &type)) {
    error = errno_text("VIDIOC_STREAMON");
    cleanup_mmap_setup_failure(fd);
    return false;
  }
  std::cerr << "[Capture] Streaming started with " << num_buffers_
            << " buffers\n";
  return true;
}

bool CaptureV4L2::configure_device(int fd, CaptureParams &params,
                                   std::string &error) {
  cleanup_mmap_buffers();

  v4l2_capability cap{};
  if (!xioctl(fd, VIDIOC_QUERYCAP, &cap)) {
    error = errno_text("VIDIOC_QUERYCAP");
    return false;
  }
  const __u32 caps = effective_caps(cap);
  std::cerr << "[Capture] Camera: " << cap.card << ", caps=0x" << std::hex
            << caps << std::dec << "\n";
  if (!(caps & V4L2_CAP_VIDEO_CAPTURE)) {
    error = "no V4L2_CAP_VIDEO_CAPTURE";
    return false;
  }
  use_mmap_ = (caps & V4L2_CAP_STREAMING) != 0;
  if (!use_mmap_ && !(caps & V4L2_CAP_READWRITE)) {
    error = "camera supports neither streaming nor read/write";
    return false;
  }

  if (!negotiate_format(fd, params, error))
    return false;
  apply_jpeg_quality(fd, params);
  apply_frame_rate(fd, params);

  if (use_mmap_)
    return setup_mmap(fd, error);

  constexpr size_t kMaxFrame = 8 * 1024 * 1024; // up to 1080p YUYV
  read_buf_.resize(frame_size_ > 0 ? frame_size_ : kMaxFrame);
  return true;
}

bool CaptureV4L2::open(CaptureParams &params, std::string &error) {
  std::lock_guard<std::mutex> lock(io_mu_);
  if (fd_ >= 0) {
    error = "device already open";
    return false;
  }
  const std::string path = device_path(device_id_);
  int fd = ::open(path.c_str(), O_RDWR | O_NONBLOCK);
  if (fd < 0) {
    error = "failed to open " + path + ": " + strerror(errno);
    return false;
  }
  if (!configure_device(fd, params, error)) {
    ::close(fd);
    return false;
  }
  fd_ = fd;
  return true;
}

GrabStatus CaptureV4L2::grab(std::string &out, std::string &error) {
  const int fd = fd_.load();
  if (fd < 0) {
    error = "device released";
    return GrabStatus::Error;
  }

  fd_set fds;
  FD_ZERO(&fds);
  FD_SET(fd, &fds);
  timeval tv{};
  tv.tv_sec = 0;
  tv.tv_usec = kGrabTimeoutUsec;
  int r = select(fd + 1, &fds, nullptr, nullptr, &tv);
  if (r < 0) {
    if (errno == EINTR)
      return GrabStatus::Timeout;
    error = errno_text("select");
    return GrabStatus::Error;
  }
  if (r == 0)
    return GrabStatus::Timeout;

  std::lock_guard<std::mutex> lock(io_mu_);
  if (fd_.load() != fd) {
    error = "device released";
    return GrabStatus::Error;
  }
  return use_mmap_ ? grab_mmap(fd, out, error) : grab_read(fd, out, error);
}

GrabStatus CaptureV4L2::grab_mmap(int fd, std::string &out,
                                  std::string &error) {
  v4l2_buffer buf{};
  buf.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  buf.memory = V4L2_MEMORY_MMAP;
  if (!xioctl(fd, VIDIOC_DQBUF, &buf)) {
    if (errno == EAGAIN)
      return GrabStatus::Timeout;
    error = errno_text("VIDIOC_DQBUF");
    return GrabStatus::Error;
  }
  if (buf.index >= num_buffers_) {
    error = "driver returned buffer index out of range";
    return GrabStatus::Error;
  }

  out.assign(static_cast<char *>(buffers_[buf.index].start), buf.bytesused);

  if (!xioctl(fd, VIDIOC_QBUF, &buf)) {
    error = errno_text("VIDIOC_QBUF (requeue)");
    return GrabStatus::Error;
  }
  return out.empty() ? GrabStatus::Timeout : GrabStatus::Frame;
}

GrabStatus CaptureV4L2::grab_read(int fd, std::string &out,
                                  std::string &error) {
  ssize_t n = ::read(fd, read_buf_.data(), read_buf_.size());
  if (n < 0) {
    if (errno == EAGAIN || errno == EINTR)
      return GrabStatus::Timeout;
    error = errno_text("read");
    return GrabStatus::Error;
  }
  if (n == 0)
    return GrabStatus::Timeout;
  out.assign(read_buf_.data(), static_cast<size_t>(n));
  return GrabStatus::Frame;
}

void CaptureV4L2::release() {
  std::lock_guard<std::mutex> lock(io_mu_);
  const int fd = fd_.exchange(-1);
  if (fd < 0)
    return;
  if (use_mmap_) {
    v4l2_buf_type type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    xioctl(fd, VIDIOC_STREAMOFF, &type);
    cleanup_mmap_buffers();
  }
  ::close(fd);
  std::cerr << "[Capture] " << device_path(device_id_) << " closed\n";
}

#else

std::vector<std::string> list_capture_devices() { return {}; }

std::unique_ptr<CameraProvider> probe_camera_provider(const std::string &) {
  return std::make_unique<UnavailableCameraProvider>(
      "V4L2 capture is only supported on Linux");
}

#endif // __linux__
