#include "core/fps_tracker.hpp"

namespace tfp {

FpsTracker::FpsTracker(std::size_t max_samples, std::chrono::nanoseconds max_age)
    : max_samples_(max_samples < 2 ? 2 : max_samples), max_age_(max_age) {}

void FpsTracker::record_tick(TimePoint timestamp) {
  std::lock_guard<std::mutex> lock(mu_);

  // Out-of-order timestamps would make the span negative
  if (!ticks_.empty() && timestamp < ticks_.back()) return;

  ticks_.push_back(timestamp);
  while (ticks_.size() > max_samples_) ticks_.pop_front();
  while (ticks_.size() > 2 && timestamp - ticks_.front() > max_age_) ticks_.pop_front();
}

double FpsTracker::current_fps() const {
  std::lock_guard<std::mutex> lock(mu_);
  if (ticks_.size() < 2) return 0.0;

  const double span_s = std::chrono::duration<double>(ticks_.back() - ticks_.front()).count();
  if (span_s <= 0.0) return 0.0;
  return static_cast<double>(ticks_.size() - 1) / span_s;
}

std::size_t FpsTracker::sample_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return ticks_.size();
}

void FpsTracker::reset() {
  std::lock_guard<std::mutex> lock(mu_);
  ticks_.clear();
}

} // namespace tfp
