#include "infra/triple_buffer.hpp"

#include <utility>

namespace tfp {

bool TripleBuffer::publish(FramePtr frame) {
  if (!frame) return false;

  FramePtr superseded;
  {
    std::lock_guard<std::mutex> lock(mu_);

    if (frame->index <= latest_index_locked()) {
      ++rejected_stale_;
      return false;
    }

    // Stage into Back, then exchange Back and Ready. The old Ready (never shown) ends up in Back
    slots_[role_[kBack]] = std::move(frame);
    std::swap(role_[kBack], role_[kReady]);
    superseded = std::move(slots_[role_[kBack]]);
    slots_[role_[kBack]].reset();

    ready_pending_ = true;
    ++generation_;
    ++published_;
  }
  // 'superseded' releases its pixels here, outside the lock
  return true;
}

FramePtr TripleBuffer::acquire_latest() {
  FramePtr previous_front;
  FramePtr out;
  {
    std::lock_guard<std::mutex> lock(mu_);

    if (ready_pending_) {
      std::swap(role_[kFront], role_[kReady]);
      // The old Front is now in the Ready role; drop it so the slot is free
      previous_front = std::move(slots_[role_[kReady]]);
      slots_[role_[kReady]].reset();
      ready_pending_ = false;
    }
    out = slots_[role_[kFront]];
  }
  return out;
}

std::uint64_t TripleBuffer::front_index() const {
  std::lock_guard<std::mutex> lock(mu_);
  return IndexOf(slots_[role_[kFront]]);
}

std::uint64_t TripleBuffer::latest_index() const {
  std::lock_guard<std::mutex> lock(mu_);
  return latest_index_locked();
}

std::uint64_t TripleBuffer::latest_index_locked() const {
  if (ready_pending_) return IndexOf(slots_[role_[kReady]]);
  return IndexOf(slots_[role_[kFront]]);
}

bool TripleBuffer::has_pending() const {
  std::lock_guard<std::mutex> lock(mu_);
  return ready_pending_;
}

std::uint64_t TripleBuffer::generation() const {
  std::lock_guard<std::mutex> lock(mu_);
  return generation_;
}

std::uint64_t TripleBuffer::published_total() const {
  std::lock_guard<std::mutex> lock(mu_);
  return published_;
}

std::uint64_t TripleBuffer::rejected_stale_total() const {
  std::lock_guard<std::mutex> lock(mu_);
  return rejected_stale_;
}

} // namespace tfp
