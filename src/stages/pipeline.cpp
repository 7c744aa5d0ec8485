#include "stages/pipeline.hpp"

#include <iostream>
#include <stdexcept>

#include "core/config_loader.hpp"

namespace tfp {

PipelineConfig Pipeline::Validated(PipelineConfig cfg) {
  ValidatePipelineOrThrow(cfg);
  return cfg;
}

Pipeline::Pipeline(PipelineConfig cfg, const RendererFactory& factory, PresentationSurface& surface)
    : ctx_(Validated(std::move(cfg))),
      frame_queue_(ctx_),
      pool_(ctx_, factory),
      dispatcher_(ctx_, pool_, frame_queue_, triple_buffer_),
      display_(ctx_.cfg.target_fps, triple_buffer_, surface, fps_, ctx_.metrics.make_stage("display")) {}

Pipeline::~Pipeline() {
  stop();
}

void Pipeline::start() {
  if (started_) throw std::runtime_error("Pipeline already started");
  started_ = true;

  std::cout << "[pipeline] starting: " << ctx_.cfg.worker_count << " workers, "
            << ctx_.cfg.target_fps << " fps, queue " << ctx_.cfg.queue_capacity
            << ", timeout " << ctx_.cfg.worker_timeout_ms << " ms, retries " << ctx_.cfg.retry_limit << std::endl;

  // Consumers first
  display_.start(ctx_.stop.token());
  dispatcher_.start(ctx_.stop.token());
  pool_.start();
}

void Pipeline::stop() {
  if (!started_ || stopped_) return;
  stopped_ = true;

  ctx_.stop.request_stop();

  // Producers first
  pool_.stop();
  dispatcher_.stop();
  display_.stop();
}

PipelineStats Pipeline::stats() const {
  PipelineStats s;
  s.fps = fps_.current_fps();

  s.submitted = dispatcher_.submitted_total();
  s.completed = dispatcher_.completed_total();
  s.retries = dispatcher_.retries_total();
  s.timeouts = dispatcher_.timeouts_total();
  s.worker_failures = dispatcher_.failures_total();
  s.abandoned = dispatcher_.abandoned_total();
  s.late_results = dispatcher_.late_results_total();
  s.mailbox_drops = pool_.mailbox_drops_total();
  s.dropped_requests = dispatcher_.dropped_requests_total();

  s.stale_frames = frame_queue_.stale_total() + triple_buffer_.rejected_stale_total();
  s.evicted_frames = frame_queue_.evicted_total();

  s.published = triple_buffer_.published_total();
  s.presented = display_.presented_total();
  s.redisplayed = display_.redisplayed_total();
  s.empty_ticks = display_.empty_ticks_total();
  s.present_errors = display_.present_errors_total();
  s.display_overruns = display_.overruns_total();

  s.queue_size = frame_queue_.size();
  s.queue_capacity = frame_queue_.capacity();
  s.pending = dispatcher_.pending_count();
  s.in_flight = dispatcher_.in_flight_count();
  s.last_presented_index = display_.last_presented_index();
  return s;
}

} // namespace tfp
