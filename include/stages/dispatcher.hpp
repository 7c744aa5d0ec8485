#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/frame_queue.hpp"
#include "core/pipeline_context.hpp"
#include "core/render_request.hpp"
#include "infra/triple_buffer.hpp"
#include "stages/stage.hpp"
#include "stages/worker_pool.hpp"

/*
    Dispatcher is the pipeline's control thread.

    - submit() issues the next index and hands the request to an idle worker, or queues it. Outstanding
      work stays at about queue_capacity: past that, the oldest untried pending request gives way.
    - Worker events arrive over the context's event channel and are handled on this thread only.
    - A failed or timed-out request goes back to the front of the queue, preferably for a different worker,
      until it has been retried retry_limit times; then it is abandoned and its index is never completed.
    - A result whose index is no longer in flight (abandoned, or already delivered by another worker) is
      counted as late and thrown away, so an abandoned index never reaches the FrameQueue.
    - After each batch of events it runs the publication step: freshest buffered frame -> TripleBuffer.

    Every public method is thread-safe. The on_* handlers and check_timeouts() can also be driven directly,
    without starting the thread, which is how the tests exercise it.
*/

namespace tfp {

class Dispatcher final : public Stage {
public:
  // Builds the scene for a given index when the dispatcher tops up its own requests
  using SceneSource = std::function<SceneState(std::uint64_t index)>;

  Dispatcher(PipelineContext& ctx, WorkerPool& pool, FrameQueue& frame_queue, TripleBuffer& triple_buffer);
  ~Dispatcher() override;

  // Optional. Must be set before start()
  void set_scene_source(SceneSource source);

  // Issues the next index. With queue_capacity requests already outstanding, the oldest pending request
  // that has never been tried is dropped to make room
  std::uint64_t submit(SceneState scene);

  void on_worker_result(std::size_t worker_id, std::uint64_t index, FramePtr frame);
  void on_worker_failure(std::size_t worker_id, std::uint64_t index, const std::string& reason = "");
  void handle_event(WorkerEvent ev);

  // Treats every in-flight request whose deadline is at or before 'now' as failed. Returns how many expired
  std::size_t check_timeouts(TimePoint now);

  // evict -> take freshest -> publish. True if a frame was published
  bool publish_freshest();

  // Submits scenes from the SceneSource while has_capacity(). Returns how many were submitted
  std::size_t top_up();

  // Pending + in flight
  std::size_t outstanding() const;
  bool has_capacity() const;

  std::size_t pending_count() const;
  std::size_t in_flight_count() const;
  std::optional<std::size_t> assigned_worker(std::uint64_t index) const;
  std::uint64_t next_index() const;

  std::uint64_t submitted_total() const;
  std::uint64_t completed_total() const;
  std::uint64_t retries_total() const;
  std::uint64_t timeouts_total() const;
  std::uint64_t failures_total() const;
  std::uint64_t abandoned_total() const;
  std::uint64_t late_results_total() const;
  std::uint64_t dropped_requests_total() const;

protected:
  void run(const StopToken& global_stop,
           const std::atomic_bool& local_stop) override;

private:
  struct Pending {
    RenderRequest request;
    int retries{0};
    std::optional<std::size_t> avoid_worker;
  };

  struct InFlight {
    RenderRequest request;
    std::size_t worker_id{0};
    int retries{0};
    TimePoint deadline{};
  };

  void enqueue_locked(RenderRequest request);
  bool drop_oldest_fresh_locked();
  void assign_pending_locked(TimePoint now);
  std::optional<std::size_t> pick_worker_locked(const std::optional<std::size_t>& avoid);
  void release_worker_locked(std::size_t worker_id, std::uint64_t index);
  void fail_locked(std::size_t worker_id, std::uint64_t index, const std::string& reason);

  PipelineContext& ctx_;
  WorkerPool& pool_;
  FrameQueue& frame_queue_;
  TripleBuffer& triple_buffer_;

  const std::chrono::milliseconds timeout_;
  SceneSource scene_source_;

  mutable std::mutex mu_;
  std::uint64_t next_index_{kNoFrame + 1};
  std::deque<Pending> pending_;
  std::unordered_map<std::uint64_t, InFlight> in_flight_;
  // assigned_[w] is the index worker w is currently charged with, kNoFrame if idle
  std::vector<std::uint64_t> assigned_;
  std::size_t rr_cursor_{0};

  std::uint64_t submitted_{0};
  std::uint64_t completed_{0};
  std::uint64_t retries_{0};
  std::uint64_t timeouts_{0};
  std::uint64_t failures_{0};
  std::uint64_t abandoned_{0};
  std::uint64_t late_results_{0};
  std::uint64_t dropped_requests_{0};
};

} // namespace tfp
