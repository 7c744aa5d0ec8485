#pragma once

#include <cstddef>
#include <cstdint>

#include "core/config.hpp"
#include "core/fps_tracker.hpp"
#include "core/frame_queue.hpp"
#include "core/pipeline_context.hpp"
#include "core/renderer.hpp"
#include "infra/triple_buffer.hpp"
#include "stages/dispatcher.hpp"
#include "stages/display_loop.hpp"
#include "stages/worker_pool.hpp"

namespace tfp {

// Read-only snapshot of every pipeline counter
struct PipelineStats {
  double fps{0.0};

  std::uint64_t submitted{0};
  std::uint64_t completed{0};
  std::uint64_t retries{0};
  std::uint64_t timeouts{0};
  std::uint64_t worker_failures{0};
  std::uint64_t abandoned{0};
  std::uint64_t late_results{0};
  // Requests overwritten in a busy worker's mailbox
  std::uint64_t mailbox_drops{0};
  // Pending requests pushed out by submit() when the dispatcher was full
  std::uint64_t dropped_requests{0};

  // FrameQueue stale discards + TripleBuffer rejections
  std::uint64_t stale_frames{0};
  std::uint64_t evicted_frames{0};

  std::uint64_t published{0};
  std::uint64_t presented{0};
  std::uint64_t redisplayed{0};
  std::uint64_t empty_ticks{0};
  std::uint64_t present_errors{0};
  std::uint64_t display_overruns{0};

  std::size_t queue_size{0};
  std::size_t queue_capacity{0};
  std::size_t pending{0};
  std::size_t in_flight{0};
  std::uint64_t last_presented_index{0};
};

/*
    Owns one complete pipeline: context, worker pool, dispatcher, frame queue, triple buffer and display loop.

    The configuration is validated in the constructor, so a bad PipelineConfig throws before any thread
    exists. start() runs the stages, consumers first; stop() signals everyone and joins producers first.
    A Pipeline runs once: after stop() it cannot be restarted.
*/
class Pipeline {
public:
  Pipeline(PipelineConfig cfg, const RendererFactory& factory, PresentationSurface& surface);
  ~Pipeline();

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  void start();
  void stop();

  std::uint64_t submit(SceneState scene) { return dispatcher_.submit(std::move(scene)); }
  // Must be called before start()
  void set_scene_source(Dispatcher::SceneSource source) { dispatcher_.set_scene_source(std::move(source)); }

  PipelineStats stats() const;

  PipelineContext& context() { return ctx_; }
  const PipelineConfig& config() const { return ctx_.cfg; }
  WorkerPool& pool() { return pool_; }
  Dispatcher& dispatcher() { return dispatcher_; }
  FrameQueue& frame_queue() { return frame_queue_; }
  TripleBuffer& triple_buffer() { return triple_buffer_; }
  DisplayLoop& display() { return display_; }
  const FpsTracker& fps() const { return fps_; }

private:
  static PipelineConfig Validated(PipelineConfig cfg);

  PipelineContext ctx_;
  FrameQueue frame_queue_;
  TripleBuffer triple_buffer_;
  FpsTracker fps_;
  WorkerPool pool_;
  Dispatcher dispatcher_;
  DisplayLoop display_;

  bool started_{false};
  bool stopped_{false};
};

} // namespace tfp
