#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>

#include "core/frame.hpp"

namespace tfp {

// Rolling frame-rate estimate over the last 'max_samples' ticks, ignoring ticks older than 'max_age'.
// Fed by the display loop, read by anyone.
class FpsTracker {
public:
  explicit FpsTracker(std::size_t max_samples = 60,
                      std::chrono::nanoseconds max_age = std::chrono::seconds(1));

  void record_tick(TimePoint timestamp);

  // (n - 1) / (newest - oldest); 0 with fewer than two samples
  double current_fps() const;

  std::size_t sample_count() const;
  void reset();

private:
  const std::size_t max_samples_;
  const std::chrono::nanoseconds max_age_;

  mutable std::mutex mu_;
  std::deque<TimePoint> ticks_;
};

} // namespace tfp
