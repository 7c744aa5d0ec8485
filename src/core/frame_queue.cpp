#include "core/frame_queue.hpp"

#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

#include "core/pipeline_context.hpp"

namespace tfp {

FrameQueue::FrameQueue(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) throw std::invalid_argument("FrameQueue capacity must be > 0");
}

FrameQueue::FrameQueue(const PipelineContext& ctx) : FrameQueue(ctx.cfg.queue_capacity) {}

bool FrameQueue::insert(FramePtr frame) {
  if (!frame || frame->index == kNoFrame) return false;

  FramePtr victim;  // released after unlocking
  std::lock_guard<std::mutex> lock(mu_);

  const std::uint64_t idx = frame->index;

  if (idx <= last_taken_) {
    ++stale_;
    return false;
  }

  if (frames_.count(idx) != 0) {
    ++duplicates_;
    return false;
  }

  if (idx > highest_seen_) highest_seen_ = idx;

  if (frames_.size() >= capacity_) {
    auto oldest = frames_.begin();
    // Nothing buffered is older than the newcomer, so the newcomer is the one to go
    if (idx < oldest->first) {
      ++evicted_;
      return false;
    }
    victim = std::move(oldest->second);
    frames_.erase(oldest);
    ++evicted_;
  }

  frames_.emplace(idx, std::move(frame));
  ++inserted_;
  return true;
}

std::size_t FrameQueue::evict_older_than(std::uint64_t window_size) {
  std::vector<FramePtr> victims;
  std::lock_guard<std::mutex> lock(mu_);

  if (highest_seen_ <= window_size) return 0;
  const std::uint64_t cutoff = highest_seen_ - window_size;  // keep indices >= cutoff

  auto end = frames_.lower_bound(cutoff);
  for (auto it = frames_.begin(); it != end; ++it) victims.push_back(std::move(it->second));
  frames_.erase(frames_.begin(), end);

  evicted_ += victims.size();
  return victims.size();
}

FramePtr FrameQueue::try_take_next(std::uint64_t after_index) {
  std::vector<FramePtr> discarded;
  FramePtr out;
  std::lock_guard<std::mutex> lock(mu_);

  if (frames_.empty()) return nullptr;

  auto newest = std::prev(frames_.end());
  if (newest->first <= after_index) {
    // Everything buffered is already behind the display
    for (auto& kv : frames_) discarded.push_back(std::move(kv.second));
    stale_ += frames_.size();
    frames_.clear();
    if (after_index > last_taken_) last_taken_ = after_index;
    return nullptr;
  }

  out = std::move(newest->second);
  last_taken_ = newest->first;

  // All remaining entries are older than the one taken
  for (auto it = frames_.begin(); it != newest; ++it) discarded.push_back(std::move(it->second));
  stale_ += discarded.size();
  frames_.clear();

  return out;
}

std::size_t FrameQueue::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return frames_.size();
}

std::uint64_t FrameQueue::highest_seen() const {
  std::lock_guard<std::mutex> lock(mu_);
  return highest_seen_;
}

std::uint64_t FrameQueue::low_water_index() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_taken_ + 1;
}

std::uint64_t FrameQueue::inserted_total() const {
  std::lock_guard<std::mutex> lock(mu_);
  return inserted_;
}

std::uint64_t FrameQueue::duplicates_total() const {
  std::lock_guard<std::mutex> lock(mu_);
  return duplicates_;
}

std::uint64_t FrameQueue::stale_total() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stale_;
}

std::uint64_t FrameQueue::evicted_total() const {
  std::lock_guard<std::mutex> lock(mu_);
  return evicted_;
}

} // namespace tfp
