#include "stages/display_loop.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>

namespace tfp {

static std::chrono::nanoseconds PeriodFor(double target_fps) {
  if (!(target_fps > 0.0)) throw std::invalid_argument("DisplayLoop: target_fps must be > 0");
  return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::duration<double>(1.0 / target_fps));
}

DisplayLoop::DisplayLoop(double target_fps, TripleBuffer& triple_buffer, PresentationSurface& surface,
                         FpsTracker& fps, StageMetrics* metrics)
    : Stage("display"), period_(PeriodFor(target_fps)), triple_buffer_(triple_buffer), surface_(surface),
      fps_(fps), metrics_(metrics) {}

DisplayLoop::~DisplayLoop() {
  stop();
}

TickOutcome DisplayLoop::tick(TimePoint now) {
  ticks_.fetch_add(1, std::memory_order_relaxed);
  fps_.record_tick(now);

  const FramePtr frame = triple_buffer_.acquire_latest();
  if (!frame) {
    empty_.fetch_add(1, std::memory_order_relaxed);
    return TickOutcome::Empty;
  }

  const std::uint64_t prev = last_index_.load(std::memory_order_relaxed);
  const bool is_new = frame->index != prev;
  if (frame->index < prev) monotonic_violations_.fetch_add(1, std::memory_order_relaxed);

  const auto t0 = std::chrono::steady_clock::now();
  try {
    surface_.present(frame->pixels, frame->width, frame->height);
  } catch (const std::exception& e) {
    present_errors_.fetch_add(1, std::memory_order_relaxed);
    std::cerr << "[display] present failed for frame " << frame->index << ": " << e.what() << std::endl;
    if (metrics_) {
      metrics_->on_failure(static_cast<std::uint64_t>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - t0).count()));
    }
    return TickOutcome::Failed;
  }

  if (metrics_) {
    metrics_->on_item(static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - t0).count()));
  }

  last_index_.store(frame->index, std::memory_order_relaxed);

  if (is_new) {
    presented_.fetch_add(1, std::memory_order_relaxed);
    return TickOutcome::Presented;
  }
  redisplayed_.fetch_add(1, std::memory_order_relaxed);
  return TickOutcome::Redisplayed;
}

void DisplayLoop::run(const StopToken& global, const std::atomic_bool& local) {
  auto deadline = Clock::now();

  while (!global.stop_requested() && !local.load(std::memory_order_relaxed)) {
    tick(Clock::now());

    deadline += period_;
    const auto after = Clock::now();
    if (after >= deadline) {
      // Overran: start the next tick right away and schedule from here, no catch-up
      overruns_.fetch_add(1, std::memory_order_relaxed);
      deadline = after;
      continue;
    }

    if (!ThreadRunner::SleepUntil(deadline, global, local)) break;
  }
}

} // namespace tfp
