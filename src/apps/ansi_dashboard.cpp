#include "apps/ansi_dashboard.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace tfp {

static constexpr const char* kReset = "\033[0m";
static constexpr const char* kRed   = "\033[31m";
static constexpr const char* kGreen = "\033[32m";
static constexpr const char* kYellow= "\033[33m";

// Fill a simple bar based on ratio of used/cap
static std::string Bar(std::size_t used, std::size_t cap, std::size_t width) {
  if (cap == 0) return std::string(width, '.');
  const double frac = std::min(1.0, static_cast<double>(used) / static_cast<double>(cap));

  const std::size_t filled = static_cast<std::size_t>(frac * width);
  std::string s;
  s.reserve(width);
  for (std::size_t i = 0; i < width; ++i) s.push_back(i < filled ? 'I' : '_');
  return s;
}

AnsiDashboard::AnsiDashboard(Pipeline& pipeline, std::atomic_bool& quit_flag, std::chrono::milliseconds refresh)
    : pipeline_(pipeline), quit_(quit_flag), refresh_(refresh) {
  FrameQueue& fq = pipeline_.frame_queue();
  queues_.push_back(QueueView{"frames",
                              [&fq] { return fq.size(); },
                              [&fq] { return fq.capacity(); },
                              [&fq] { return fq.evicted_total() + fq.stale_total(); }});

  auto events = pipeline_.context().events;
  queues_.push_back(QueueView{"events",
                              [events] { return events->size(); },
                              [events] { return events->capacity(); },
                              [events] { return events->drops_total(); }});

  Dispatcher& d = pipeline_.dispatcher();
  const std::size_t cap = pipeline_.config().queue_capacity;
  queues_.push_back(QueueView{"requests",
                              [&d] { return d.outstanding(); },
                              [cap] { return cap; },
                              [&d] { return d.abandoned_total(); }});
}

void AnsiDashboard::run(const StopToken& stop) {
  using namespace std::chrono;

  std::cout << "\033[2J\033[H" << std::flush;

  auto last = steady_clock::now();

  while (!stop.stop_requested() && !quit_.load(std::memory_order_relaxed)) {
    std::this_thread::sleep_for(refresh_);

    const auto now = steady_clock::now();
    const double dt = duration_cast<duration<double>>(now - last).count();
    last = now;

    draw(dt);
  }
}

// Shows per-thread FPS, busy %, EMA latency and time since last item, then queue fill and counters
void AnsiDashboard::draw(double dt) {
  const auto now_ns = NowNs();

  std::cout << "\033[H";
  std::cout << "TRIPLE FRAME PIPELINE\n";
  std::cout << "quit: " << (quit_.load(std::memory_order_relaxed) ? "pending" : "no") << "\n\n";

  std::cout << std::left
            << std::setw(14) << "STAGE"
            << std::setw(10) << "FPS"
            << std::setw(10) << "BUSY%"
            << std::setw(12) << "LAT(ms)"
            << std::setw(12) << "LAST(ms)"
            << std::setw(8) << "FAIL"
            << "\n";
  std::cout << std::string(14 + 10 + 10 + 12 + 12 + 8, '-') << "\n";

  for (const auto& up : pipeline_.context().metrics.stages()) {
    const StageMetrics& m = *up;
    auto& p = prev_stage_[up.get()];

    const auto c = m.count.load(std::memory_order_relaxed);
    const double fps = (dt > 0) ? (static_cast<double>(c - p.count) / dt) : 0.0;
    p.count = c;

    const auto work = m.work_ns_total.load(std::memory_order_relaxed);
    double busy = (dt > 0) ? static_cast<double>(work - p.work_ns) / (dt * 1e9) : 0.0;
    busy = std::max(0.0, std::min(1.0, busy));
    auto busy_color = (busy > 0.85) ? kRed : (busy > 0.60) ? kYellow : kGreen;
    p.work_ns = work;

    const double lat_ms = NsToMs(m.avg_latency_ns.load(std::memory_order_relaxed));
    const auto le = m.last_event_ns.load(std::memory_order_relaxed);
    const double last_ms = (le == 0 || le > now_ns) ? 0.0 : NsToMs(now_ns - le);

    std::cout << std::left
              << std::setw(14) << m.name
              << std::setw(10) << std::fixed << std::setprecision(1) << fps
              << busy_color << std::setw(10) << std::fixed << std::setprecision(1) << (busy * 100.0) << kReset
              << std::setw(12) << std::fixed << std::setprecision(1) << lat_ms
              << std::setw(12) << std::fixed << std::setprecision(1) << last_ms
              << std::setw(8) << m.failures.load(std::memory_order_relaxed)
              << "\n";
  }

  std::cout << "\nQUEUES\n";
  for (const auto& q : queues_) {
    const auto used = q.size_fn ? q.size_fn() : 0;
    const auto cap  = q.cap_fn ? q.cap_fn() : 0;

    double frac = (cap == 0) ? 0.0 : static_cast<double>(used) / static_cast<double>(cap);
    const char* color = (frac > 0.85) ? kRed : (frac > 0.60) ? kYellow : kGreen;

    std::uint64_t total_drops = q.drops_fn ? q.drops_fn() : 0;
    std::uint64_t& prev_total = prev_qdrops_[q.name];
    const double drop_ps = dt > 0 ? (static_cast<double>(total_drops - prev_total) / dt) : 0.0;
    prev_total = total_drops;

    std::cout << "  " << std::setw(11) << std::left << q.name
              << " " << color << std::setw(3) << used << "/" << std::setw(3) << cap
              << " [" << Bar(used, cap, 24) << "]" << kReset
              << "  drop/s=" << std::fixed << std::setprecision(1) << drop_ps
              << "      \n";
  }

  std::cout << "\nCOUNTERS\n  " << StatsLine(pipeline_.stats()) << "\033[K\n" << std::flush;
}

std::string StatsLine(const PipelineStats& s) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1)
      << "fps=" << s.fps
      << " shown=" << s.last_presented_index
      << " presented=" << s.presented
      << " redisplayed=" << s.redisplayed
      << " submitted=" << s.submitted
      << " completed=" << s.completed
      << " stale=" << s.stale_frames
      << " evicted=" << s.evicted_frames
      << " retries=" << s.retries
      << " timeouts=" << s.timeouts
      << " failures=" << s.worker_failures
      << " abandoned=" << s.abandoned
      << " late=" << s.late_results
      << " mailbox_drops=" << s.mailbox_drops
      << " dropped=" << s.dropped_requests
      << " queue=" << s.queue_size << "/" << s.queue_capacity
      << " in_flight=" << s.in_flight
      << " pending=" << s.pending;
  return oss.str();
}

} // namespace tfp
