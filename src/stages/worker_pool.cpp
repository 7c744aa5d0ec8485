#include "stages/worker_pool.hpp"

#include <stdexcept>
#include <string>

namespace tfp {

WorkerPool::WorkerPool(PipelineContext& ctx, const RendererFactory& factory)
    : ctx_(ctx), busy_(ctx.cfg.worker_count, false) {
  if (!factory) throw std::invalid_argument("WorkerPool: renderer factory is empty");

  workers_.reserve(ctx_.cfg.worker_count);
  for (std::size_t i = 0; i < ctx_.cfg.worker_count; ++i) {
    std::unique_ptr<Renderer> r = factory(i);
    if (!r) throw std::invalid_argument("WorkerPool: factory returned no renderer for worker " + std::to_string(i));

    StageMetrics* m = ctx_.metrics.make_stage("worker_" + std::to_string(i));
    workers_.push_back(std::make_unique<RenderWorker>(i, std::move(r), ctx_.events, m));
  }
}

WorkerPool::~WorkerPool() {
  stop();
}

void WorkerPool::start() {
  for (auto& w : workers_) w->start(ctx_.stop.token());
}

// Signal everyone first so a slow worker doesn't delay the others' shutdown
void WorkerPool::stop() {
  for (auto& w : workers_) w->request_stop();
  for (auto& w : workers_) w->stop();
}

bool WorkerPool::try_submit(std::size_t worker_id, const RenderRequest& request) {
  std::lock_guard<std::mutex> lock(mu_);
  if (worker_id >= workers_.size() || busy_[worker_id]) return false;

  busy_[worker_id] = true;
  ++submitted_;
  workers_[worker_id]->post(request);
  return true;
}

void WorkerPool::release(std::size_t worker_id) {
  std::lock_guard<std::mutex> lock(mu_);
  if (worker_id < busy_.size()) busy_[worker_id] = false;
}

bool WorkerPool::is_busy(std::size_t worker_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return worker_id < busy_.size() && busy_[worker_id];
}

std::size_t WorkerPool::idle_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::size_t n = 0;
  for (bool b : busy_) n += b ? 0 : 1;
  return n;
}

std::uint64_t WorkerPool::submitted_total() const {
  std::lock_guard<std::mutex> lock(mu_);
  return submitted_;
}

std::uint64_t WorkerPool::mailbox_drops_total() const {
  std::uint64_t n = 0;
  for (const auto& w : workers_) n += w->mailbox_drops();
  return n;
}

} // namespace tfp
