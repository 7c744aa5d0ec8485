#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "core/fps_tracker.hpp"
#include "core/renderer.hpp"
#include "infra/metrics.hpp"
#include "infra/triple_buffer.hpp"
#include "stages/stage.hpp"

namespace tfp {

// What one tick did
enum class TickOutcome {
  Empty,        // nothing published yet
  Presented,    // a new frame went to the surface
  Redisplayed,  // no new frame in time, the previous one was shown again
  Failed        // the surface threw
};

/*
    DisplayLoop runs at target_fps on its own thread and only ever talks to the TripleBuffer and the
    presentation surface. Each tick takes whatever acquire_latest() returns; if nothing new arrived the
    previous frame is presented again. It never waits for a worker.

    Overrun policy: if a tick finishes past its deadline, the next tick runs immediately and the schedule
    restarts from there, so a slow tick never causes a burst of catch-up ticks.
*/
class DisplayLoop final : public Stage {
public:
  DisplayLoop(double target_fps, TripleBuffer& triple_buffer, PresentationSurface& surface,
              FpsTracker& fps, StageMetrics* metrics = nullptr);
  ~DisplayLoop() override;

  // One tick at 'now'. Called by the loop thread; tests call it directly
  TickOutcome tick(TimePoint now);

  std::chrono::nanoseconds period() const { return period_; }

  std::uint64_t ticks_total() const { return ticks_.load(std::memory_order_relaxed); }
  std::uint64_t presented_total() const { return presented_.load(std::memory_order_relaxed); }
  std::uint64_t redisplayed_total() const { return redisplayed_.load(std::memory_order_relaxed); }
  std::uint64_t empty_ticks_total() const { return empty_.load(std::memory_order_relaxed); }
  std::uint64_t present_errors_total() const { return present_errors_.load(std::memory_order_relaxed); }
  std::uint64_t overruns_total() const { return overruns_.load(std::memory_order_relaxed); }
  // Should stay 0: a presented index lower than the one before it
  std::uint64_t monotonic_violations_total() const { return monotonic_violations_.load(std::memory_order_relaxed); }

  std::uint64_t last_presented_index() const { return last_index_.load(std::memory_order_relaxed); }

protected:
  void run(const StopToken& global_stop,
           const std::atomic_bool& local_stop) override;

private:
  const std::chrono::nanoseconds period_;
  TripleBuffer& triple_buffer_;
  PresentationSurface& surface_;
  FpsTracker& fps_;
  StageMetrics* metrics_;

  std::atomic<std::uint64_t> last_index_{kNoFrame};

  std::atomic<std::uint64_t> ticks_{0};
  std::atomic<std::uint64_t> presented_{0};
  std::atomic<std::uint64_t> redisplayed_{0};
  std::atomic<std::uint64_t> empty_{0};
  std::atomic<std::uint64_t> present_errors_{0};
  std::atomic<std::uint64_t> overruns_{0};
  std::atomic<std::uint64_t> monotonic_violations_{0};
};

} // namespace tfp
