#pragma once

#include <memory>

#include "core/config.hpp"
#include "core/worker_event.hpp"
#include "infra/bounded_queue.hpp"
#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"

namespace tfp {

// State shared by the dispatcher, the worker pool and the frame queue. One per pipeline, owned by whoever
// wires the pipeline together and passed by reference to each component's constructor.
struct PipelineContext {
  explicit PipelineContext(PipelineConfig c)
      : cfg(std::move(c)),
        events(std::make_shared<BoundedQueue<WorkerEvent>>(EventCapacity(cfg), DropPolicy::DropNewest)) {}

  PipelineContext(const PipelineContext&) = delete;
  PipelineContext& operator=(const PipelineContext&) = delete;

  const PipelineConfig cfg;
  Metrics metrics;

  // Workers -> dispatcher. A worker has at most one result outstanding per accepted request, so 4x the
  // pool size only fills up if the dispatcher thread stalls; a dropped event then surfaces as a timeout
  std::shared_ptr<BoundedQueue<WorkerEvent>> events;

  StopSource stop;

private:
  static std::size_t EventCapacity(const PipelineConfig& c) {
    return c.worker_count == 0 ? 4 : c.worker_count * 4;
  }
};

} // namespace tfp
