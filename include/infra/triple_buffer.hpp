#pragma once

#include <array>
#include <cstdint>
#include <mutex>

#include "core/frame.hpp"

/*
    TripleBuffer is the only hand-off between the publication path (dispatcher thread) and the display loop.

    Three slots rotate through three roles:
    - Front: what the display loop is currently showing. Only acquire_latest() changes it.
    - Ready: the newest published frame the display has not picked up yet.
    - Back:  where publish() stages the incoming frame before exchanging it with Ready.

    Both sides take the same mutex, but the critical section is a handful of slot-index swaps and a
    shared_ptr move. Pixels are never copied under the lock, so neither side waits on the other's work.
    A frame handed to the reader is const and ref-counted; the writer can't touch it after the swap and
    the reader may keep it past its next call.

    Frames only ever move forward: publish() refuses an index at or below the newest frame already in the
    buffer (the pending Ready one if any, else Front).
*/

namespace tfp {

class TripleBuffer {
public:
  TripleBuffer() = default;

  TripleBuffer(const TripleBuffer&) = delete;
  TripleBuffer& operator=(const TripleBuffer&) = delete;

  // Writer side. Returns false (and counts a stale rejection) if 'frame' is not newer than latest_index()
  bool publish(FramePtr frame);

  // Reader side. Promotes a pending Ready frame to Front, then returns Front (nullptr before the first publish)
  FramePtr acquire_latest();

  // Index currently in Front, kNoFrame before the first acquire
  std::uint64_t front_index() const;

  // Newest index in the buffer: pending Ready if there is one, else Front
  std::uint64_t latest_index() const;

  bool has_pending() const;

  // Increments on every accepted publish
  std::uint64_t generation() const;

  std::uint64_t published_total() const;
  std::uint64_t rejected_stale_total() const;

private:
  enum Role { kFront = 0, kReady = 1, kBack = 2 };

  static std::uint64_t IndexOf(const FramePtr& f) { return f ? f->index : kNoFrame; }

  std::uint64_t latest_index_locked() const;

  mutable std::mutex mu_;

  std::array<FramePtr, 3> slots_{};
  // role_[r] is the slot currently playing role r
  std::array<std::size_t, 3> role_{{0, 1, 2}};
  bool ready_pending_{false};

  std::uint64_t generation_{0};
  std::uint64_t published_{0};
  std::uint64_t rejected_stale_{0};
};

} // namespace tfp
