#include "stages/dispatcher.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace tfp {

// Upper bound on events handled between two publication steps
static constexpr std::size_t kMaxEventsPerBatch = 64;

Dispatcher::Dispatcher(PipelineContext& ctx, WorkerPool& pool, FrameQueue& frame_queue, TripleBuffer& triple_buffer)
    : Stage("dispatcher"), ctx_(ctx), pool_(pool), frame_queue_(frame_queue), triple_buffer_(triple_buffer),
      timeout_(ctx.cfg.worker_timeout_ms), assigned_(pool.size(), kNoFrame) {}

Dispatcher::~Dispatcher() {
  stop();
}

void Dispatcher::set_scene_source(SceneSource source) {
  scene_source_ = std::move(source);
}

std::uint64_t Dispatcher::submit(SceneState scene) {
  const auto now = Clock::now();
  std::lock_guard<std::mutex> lock(mu_);

  const std::uint64_t idx = next_index_++;
  if (pending_.size() + in_flight_.size() >= ctx_.cfg.queue_capacity) drop_oldest_fresh_locked();
  enqueue_locked(RenderRequest{idx, std::move(scene), now});
  assign_pending_locked(now);
  return idx;
}

void Dispatcher::on_worker_result(std::size_t worker_id, std::uint64_t index, FramePtr frame) {
  if (!frame || frame->index != index) {
    on_worker_failure(worker_id, index, "result carries no frame for this index");
    return;
  }

  bool accepted = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    release_worker_locked(worker_id, index);

    auto it = in_flight_.find(index);
    if (it == in_flight_.end()) {
      ++late_results_;
    } else {
      // Delivered by a worker that had timed out on it: the current assignee's copy is now redundant
      release_worker_locked(it->second.worker_id, index);
      in_flight_.erase(it);
      ++completed_;
      accepted = true;
    }

    assign_pending_locked(Clock::now());
  }

  // Not in flight any more, so nothing can abandon it between the unlock and here
  if (accepted) frame_queue_.insert(std::move(frame));
}

void Dispatcher::on_worker_failure(std::size_t worker_id, std::uint64_t index, const std::string& reason) {
  std::lock_guard<std::mutex> lock(mu_);
  ++failures_;
  release_worker_locked(worker_id, index);
  fail_locked(worker_id, index, reason.empty() ? "worker reported failure" : reason);
  assign_pending_locked(Clock::now());
}

void Dispatcher::handle_event(WorkerEvent ev) {
  if (ev.kind == WorkerEventKind::Completed) {
    on_worker_result(ev.worker_id, ev.index, std::move(ev.frame));
  } else {
    on_worker_failure(ev.worker_id, ev.index, ev.error);
  }
}

std::size_t Dispatcher::check_timeouts(TimePoint now) {
  std::lock_guard<std::mutex> lock(mu_);

  std::vector<std::pair<std::uint64_t, std::size_t>> expired;
  for (const auto& kv : in_flight_) {
    if (kv.second.deadline <= now) expired.emplace_back(kv.first, kv.second.worker_id);
  }

  for (const auto& e : expired) {
    ++timeouts_;
    std::cerr << "[dispatcher] request " << e.first << " timed out on worker_" << e.second << std::endl;
    release_worker_locked(e.second, e.first);
    fail_locked(e.second, e.first, "timed out");
  }

  if (!expired.empty()) assign_pending_locked(now);
  return expired.size();
}

bool Dispatcher::publish_freshest() {
  frame_queue_.evict_older_than(frame_queue_.capacity());

  FramePtr f = frame_queue_.try_take_next(triple_buffer_.latest_index());
  if (!f) return false;
  return triple_buffer_.publish(std::move(f));
}

std::size_t Dispatcher::top_up() {
  if (!scene_source_) return 0;

  std::size_t n = 0;
  while (true) {
    std::uint64_t idx = kNoFrame;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (pending_.size() + in_flight_.size() >= ctx_.cfg.queue_capacity) break;
      idx = next_index_++;
    }

    // The scene source is outside code; build the scene without holding the lock
    SceneState scene;
    try {
      scene = scene_source_(idx);
    } catch (const std::exception& e) {
      // The reserved index is simply never issued
      std::cerr << "[dispatcher] scene source failed for " << idx << ": " << e.what() << std::endl;
      break;
    }

    const auto now = Clock::now();
    std::lock_guard<std::mutex> lock(mu_);
    enqueue_locked(RenderRequest{idx, std::move(scene), now});
    assign_pending_locked(now);
    ++n;
  }
  return n;
}

void Dispatcher::run(const StopToken& global, const std::atomic_bool& local) {
  using namespace std::chrono_literals;

  std::vector<WorkerEvent> batch;
  batch.reserve(kMaxEventsPerBatch);

  while (!global.stop_requested() && !local.load(std::memory_order_relaxed)) {
    top_up();

    // Event wait is also the loop's heartbeat, so timeouts are checked at least every 2 ms
    batch.clear();
    ctx_.events->drain_for(batch, kMaxEventsPerBatch, 2ms);
    for (auto& ev : batch) handle_event(std::move(ev));

    check_timeouts(Clock::now());
    publish_freshest();
  }
}

void Dispatcher::enqueue_locked(RenderRequest request) {
  pending_.push_back(Pending{std::move(request), 0, std::nullopt});
  ++submitted_;
}

// Oldest never-tried pending request makes room for a newer one. Queued retries are skipped.
// The dropped index is never issued again
bool Dispatcher::drop_oldest_fresh_locked() {
  for (auto it = pending_.begin(); it != pending_.end(); ++it) {
    if (it->retries != 0) continue;
    pending_.erase(it);
    ++dropped_requests_;
    return true;
  }
  return false;
}

void Dispatcher::assign_pending_locked(TimePoint now) {
  while (!pending_.empty()) {
    const auto w = pick_worker_locked(pending_.front().avoid_worker);
    if (!w) return;

    if (!pool_.try_submit(*w, pending_.front().request)) return;

    Pending p = std::move(pending_.front());
    pending_.pop_front();

    const std::uint64_t idx = p.request.index;
    assigned_[*w] = idx;
    in_flight_[idx] = InFlight{std::move(p.request), *w, p.retries, now + timeout_};
  }
}

// Round-robin over idle workers. 'avoid' is only used if no other worker is idle
std::optional<std::size_t> Dispatcher::pick_worker_locked(const std::optional<std::size_t>& avoid) {
  const std::size_t n = assigned_.size();
  std::optional<std::size_t> fallback;

  for (std::size_t k = 0; k < n; ++k) {
    const std::size_t w = (rr_cursor_ + k) % n;
    if (assigned_[w] != kNoFrame || pool_.is_busy(w)) continue;

    if (avoid && *avoid == w) {
      fallback = w;
      continue;
    }
    rr_cursor_ = (w + 1) % n;
    return w;
  }

  if (fallback) rr_cursor_ = (*fallback + 1) % n;
  return fallback;
}

void Dispatcher::release_worker_locked(std::size_t worker_id, std::uint64_t index) {
  if (worker_id < assigned_.size() && assigned_[worker_id] == index) {
    assigned_[worker_id] = kNoFrame;
    pool_.release(worker_id);
  }
}

void Dispatcher::fail_locked(std::size_t worker_id, std::uint64_t index, const std::string& reason) {
  auto it = in_flight_.find(index);
  // Already finished, abandoned, or handed to another worker since: nothing to recover
  if (it == in_flight_.end() || it->second.worker_id != worker_id) {
    ++late_results_;
    return;
  }

  InFlight f = std::move(it->second);
  in_flight_.erase(it);

  if (f.retries < ctx_.cfg.retry_limit) {
    ++retries_;
    pending_.push_front(Pending{std::move(f.request), f.retries + 1, worker_id});
    return;
  }

  ++abandoned_;
  std::cerr << "[dispatcher] request " << index << " abandoned after " << f.retries
            << " retries (" << reason << ")" << std::endl;
}

std::size_t Dispatcher::outstanding() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pending_.size() + in_flight_.size();
}

bool Dispatcher::has_capacity() const {
  return outstanding() < ctx_.cfg.queue_capacity;
}

std::size_t Dispatcher::pending_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pending_.size();
}

std::size_t Dispatcher::in_flight_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return in_flight_.size();
}

std::optional<std::size_t> Dispatcher::assigned_worker(std::uint64_t index) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = in_flight_.find(index);
  if (it == in_flight_.end()) return std::nullopt;
  return it->second.worker_id;
}

std::uint64_t Dispatcher::next_index() const {
  std::lock_guard<std::mutex> lock(mu_);
  return next_index_;
}

std::uint64_t Dispatcher::submitted_total() const {
  std::lock_guard<std::mutex> lock(mu_);
  return submitted_;
}

std::uint64_t Dispatcher::completed_total() const {
  std::lock_guard<std::mutex> lock(mu_);
  return completed_;
}

std::uint64_t Dispatcher::retries_total() const {
  std::lock_guard<std::mutex> lock(mu_);
  return retries_;
}

std::uint64_t Dispatcher::timeouts_total() const {
  std::lock_guard<std::mutex> lock(mu_);
  return timeouts_;
}

std::uint64_t Dispatcher::failures_total() const {
  std::lock_guard<std::mutex> lock(mu_);
  return failures_;
}

std::uint64_t Dispatcher::abandoned_total() const {
  std::lock_guard<std::mutex> lock(mu_);
  return abandoned_;
}

std::uint64_t Dispatcher::late_results_total() const {
  std::lock_guard<std::mutex> lock(mu_);
  return late_results_;
}

std::uint64_t Dispatcher::dropped_requests_total() const {
  std::lock_guard<std::mutex> lock(mu_);
  return dropped_requests_;
}

} // namespace tfp
