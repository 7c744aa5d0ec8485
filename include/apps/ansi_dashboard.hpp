#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"
#include "stages/pipeline.hpp"

namespace tfp {

struct QueueView {
  std::string name;
  std::function<std::size_t()> size_fn;
  std::function<std::size_t()> cap_fn;
  std::function<std::uint64_t()> drops_fn;
};

// Full-screen terminal view of a running pipeline: per-thread rates, queue fill and counters
class AnsiDashboard {
public:
  AnsiDashboard(Pipeline& pipeline, std::atomic_bool& quit_flag,
                std::chrono::milliseconds refresh = std::chrono::milliseconds(300));

  // Redraws until 'stop' is requested or the quit flag is raised
  void run(const StopToken& stop);

private:
  void draw(double dt);

  Pipeline& pipeline_;
  std::vector<QueueView> queues_;
  std::atomic_bool& quit_;
  const std::chrono::milliseconds refresh_;

  struct Prev { std::uint64_t count{0}; std::uint64_t work_ns{0}; };
  std::unordered_map<const StageMetrics*, Prev> prev_stage_;
  std::unordered_map<std::string, std::uint64_t> prev_qdrops_;
};

// One-line summary for periodic console logging
std::string StatsLine(const PipelineStats& s);

} // namespace tfp
