#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>

#include "core/frame.hpp"

/*
    FrameQueue absorbs worker completions that arrive in any order and hands the publication path the
    freshest one.

    - insert() is idempotent per index and refuses anything at or below the last index taken out.
    - The map never holds more than 'capacity' frames. When full, the oldest index is evicted to make room
      for a newer one (freshness over completeness).
    - try_take_next() returns the highest buffered index above 'after_index' and throws away everything
      at or below it; those older completions can never be shown any more.
*/

namespace tfp {

struct PipelineContext;

class FrameQueue {
public:
  explicit FrameQueue(std::size_t capacity);
  explicit FrameQueue(const PipelineContext& ctx);

  FrameQueue(const FrameQueue&) = delete;
  FrameQueue& operator=(const FrameQueue&) = delete;

  // Returns true if the frame was buffered
  bool insert(FramePtr frame);

  // Removes entries more than 'window_size' behind the highest index seen. Returns how many were removed
  std::size_t evict_older_than(std::uint64_t window_size);

  // Freshest frame with index > after_index, or nullptr
  FramePtr try_take_next(std::uint64_t after_index);

  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }

  std::uint64_t highest_seen() const;
  // Smallest index still eligible for insertion / publication
  std::uint64_t low_water_index() const;

  std::uint64_t inserted_total() const;
  std::uint64_t duplicates_total() const;
  std::uint64_t stale_total() const;
  std::uint64_t evicted_total() const;

private:
  const std::size_t capacity_;

  mutable std::mutex mu_;
  std::map<std::uint64_t, FramePtr> frames_;

  std::uint64_t last_taken_{kNoFrame};
  std::uint64_t highest_seen_{kNoFrame};

  std::uint64_t inserted_{0};
  std::uint64_t duplicates_{0};
  std::uint64_t stale_{0};
  std::uint64_t evicted_{0};
};

} // namespace tfp
