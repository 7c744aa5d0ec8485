#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "core/pipeline_context.hpp"
#include "core/render_request.hpp"
#include "core/renderer.hpp"
#include "stages/render_worker.hpp"

namespace tfp {

/*
    Fixed set of RenderWorkers plus their busy/idle bookkeeping.

    A worker is busy from the moment try_submit() hands it a request until the dispatcher calls release()
    for it, either because the worker reported back or because its request timed out. A worker that timed
    out stays in the pool; if it is actually still stuck, the next request simply waits in its mailbox.
*/
class WorkerPool {
public:
  // Builds ctx.cfg.worker_count workers, one Renderer each. Throws std::invalid_argument if the factory
  // is empty or returns nullptr
  WorkerPool(PipelineContext& ctx, const RendererFactory& factory);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void start();
  void stop();

  // Hands 'request' to worker 'worker_id'. False if the id is out of range or the worker is busy
  bool try_submit(std::size_t worker_id, const RenderRequest& request);

  void release(std::size_t worker_id);

  bool is_busy(std::size_t worker_id) const;
  std::size_t idle_count() const;
  std::size_t size() const { return workers_.size(); }

  std::uint64_t submitted_total() const;
  std::uint64_t mailbox_drops_total() const;

private:
  PipelineContext& ctx_;
  std::vector<std::unique_ptr<RenderWorker>> workers_;

  mutable std::mutex mu_;
  std::vector<bool> busy_;
  std::uint64_t submitted_{0};
};

} // namespace tfp
