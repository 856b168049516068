#include "frame_slot.hpp"

#include <utility>

void FrameSlot::publish(std::string bytes) {
  publish(std::move(bytes), Clock::now());
}

void FrameSlot::publish(std::string bytes, Clock::time_point captured_at) {
  auto next = std::make_shared<const std::string>(std::move(bytes));
  {
    std::lock_guard<std::mutex> lock(mu_);
    bytes_.swap(next);
    captured_at_ = captured_at;
    ++sequence_;
  }
  // previous payload (now in `next`) is released outside the lock
}

std::optional<FrameSnapshot> FrameSlot::read() const {
  FrameSnapshot snap;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!bytes_)
      return std::nullopt;
    snap.bytes = bytes_;
    snap.captured_at = captured_at_;
    snap.sequence = sequence_;
  }
  snap.age = Clock::now() - snap.captured_at;
  if (snap.age < Clock::duration::zero())
    snap.age = Clock::duration::zero();
  return snap;
}

void FrameSlot::clear() {
  std::shared_ptr<const std::string> old;
  std::lock_guard<std::mutex> lock(mu_);
  bytes_.swap(old);
}
