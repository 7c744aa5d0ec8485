#pragma once

#include <cstddef>
#include <memory>

#include "core/render_request.hpp"
#include "core/renderer.hpp"
#include "core/worker_event.hpp"
#include "infra/bounded_queue.hpp"
#include "infra/metrics.hpp"
#include "stages/stage.hpp"

namespace tfp {

// One rendering thread. Takes requests from its one-slot mailbox, renders them with its own Renderer and
// posts a Completed or Failed event to the dispatcher's channel.
class RenderWorker final : public Stage {
public:
  RenderWorker(std::size_t id, std::unique_ptr<Renderer> renderer,
               std::shared_ptr<BoundedQueue<WorkerEvent>> events, StageMetrics* metrics);
  ~RenderWorker() override;

  // Never blocks. A request still waiting in the mailbox is replaced
  bool post(RenderRequest request);

  std::size_t id() const { return id_; }
  std::uint64_t mailbox_drops() const { return mailbox_.drops_total(); }

  // Runs one request on the calling thread and returns the event that would be posted
  WorkerEvent execute(const RenderRequest& request);

protected:
  void run(const StopToken& global_stop,
           const std::atomic_bool& local_stop) override;

private:
  const std::size_t id_;
  std::unique_ptr<Renderer> renderer_;
  std::shared_ptr<BoundedQueue<WorkerEvent>> events_;
  StageMetrics* metrics_;

  BoundedQueue<RenderRequest> mailbox_{1, DropPolicy::DropOldest};
};

} // namespace tfp
