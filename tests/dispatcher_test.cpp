#include <chrono>
#include <iostream>
#include <vector>

#include "core/frame_queue.hpp"
#include "core/pipeline_context.hpp"
#include "infra/triple_buffer.hpp"
#include "stages/dispatcher.hpp"
#include "stages/worker_pool.hpp"

#include "test_support.hpp"

using tfp_test::Check;

// The dispatcher is driven by hand here: no thread is started, worker results are fed in directly

using namespace std::chrono_literals;
using tfp_test::Scene;
using tfp_test::SolidFrame;

namespace {

tfp::PipelineConfig Cfg(std::size_t workers, std::size_t queue_capacity = 8, int retry_limit = 2,
                        int timeout_ms = 250) {
  tfp::PipelineConfig c;
  c.worker_count = workers;
  c.queue_capacity = queue_capacity;
  c.retry_limit = retry_limit;
  c.worker_timeout_ms = timeout_ms;
  return c;
}

// Everything a dispatcher needs, wired the way Pipeline does it
struct Rig {
  explicit Rig(tfp::PipelineConfig c)
      : ctx(std::move(c)), fq(ctx), pool(ctx, tfp_test::ScriptedFactory()), d(ctx, pool, fq, tb) {}

  tfp::PipelineContext ctx;
  tfp::FrameQueue fq;
  tfp::TripleBuffer tb;
  tfp::WorkerPool pool;
  tfp::Dispatcher d;
};

} // namespace

static void IndicesAreSequential() {
  std::cout << "[dispatcher] indices start at 1 and increase by one\n";
  Rig r(Cfg(2));

  Check(r.d.submit(Scene()) == 1, "r.d.submit(Scene()) == 1", __LINE__);
  Check(r.d.submit(Scene()) == 2, "r.d.submit(Scene()) == 2", __LINE__);
  Check(r.d.submit(Scene()) == 3, "r.d.submit(Scene()) == 3", __LINE__);
  Check(r.d.next_index() == 4, "r.d.next_index() == 4", __LINE__);
  Check(r.d.submitted_total() == 3, "r.d.submitted_total() == 3", __LINE__);
}

static void QueuesWhenNoWorkerIdle() {
  std::cout << "[dispatcher] request waits while every worker is busy\n";
  Rig r(Cfg(1));

  const auto a = r.d.submit(Scene());
  const auto b = r.d.submit(Scene());
  Check(r.d.in_flight_count() == 1, "r.d.in_flight_count() == 1", __LINE__);
  Check(r.d.pending_count() == 1, "r.d.pending_count() == 1", __LINE__);
  Check(r.d.assigned_worker(a) == std::optional<std::size_t>(0), "r.d.assigned_worker(a) == std::optional<std::size_t>(0)", __LINE__);
  Check(!r.d.assigned_worker(b).has_value(), "!r.d.assigned_worker(b).has_value()", __LINE__);
  Check(r.pool.is_busy(0), "r.pool.is_busy(0)", __LINE__);

  // Completing 'a' frees worker 0, which immediately gets 'b'
  r.d.on_worker_result(0, a, SolidFrame(a));
  Check(r.d.pending_count() == 0, "r.d.pending_count() == 0", __LINE__);
  Check(r.d.assigned_worker(b) == std::optional<std::size_t>(0), "r.d.assigned_worker(b) == std::optional<std::size_t>(0)", __LINE__);
  Check(r.d.completed_total() == 1, "r.d.completed_total() == 1", __LINE__);
  Check(r.fq.size() == 1, "r.fq.size() == 1", __LINE__);
}

static void RoundRobinAssignment() {
  std::cout << "[dispatcher] idle workers are used in turn\n";
  Rig r(Cfg(3));

  std::vector<std::uint64_t> idx;
  for (int i = 0; i < 3; ++i) idx.push_back(r.d.submit(Scene()));
  Check(r.d.assigned_worker(idx[0]) == std::optional<std::size_t>(0), "r.d.assigned_worker(idx[0]) == std::optional<std::size_t>(0)", __LINE__);
  Check(r.d.assigned_worker(idx[1]) == std::optional<std::size_t>(1), "r.d.assigned_worker(idx[1]) == std::optional<std::size_t>(1)", __LINE__);
  Check(r.d.assigned_worker(idx[2]) == std::optional<std::size_t>(2), "r.d.assigned_worker(idx[2]) == std::optional<std::size_t>(2)", __LINE__);
  Check(r.pool.idle_count() == 0, "r.pool.idle_count() == 0", __LINE__);
}

static void OutOfOrderCompletionPublishesFreshest() {
  std::cout << "[dispatcher] completions 5,3,4,1,2 publish 5 only\n";
  Rig r(Cfg(5));

  for (int i = 0; i < 5; ++i) r.d.submit(Scene());

  // Index i went to worker i-1
  for (std::uint64_t idx : {5u, 3u, 4u, 1u, 2u}) r.d.on_worker_result(idx - 1, idx, SolidFrame(idx));
  Check(r.d.completed_total() == 5, "r.d.completed_total() == 5", __LINE__);

  Check(r.d.publish_freshest(), "r.d.publish_freshest()", __LINE__);
  Check(r.tb.latest_index() == 5, "r.tb.latest_index() == 5", __LINE__);
  Check(r.fq.stale_total() == 4, "r.fq.stale_total() == 4", __LINE__);
  Check(!r.d.publish_freshest(), "!r.d.publish_freshest()", __LINE__);

  tfp::FramePtr shown = r.tb.acquire_latest();
  Check(shown && shown->index == 5, "shown && shown->index == 5", __LINE__);
}

static void LateArrivalAfterPublishIsStale() {
  std::cout << "[dispatcher] completion older than the published frame never reaches the display\n";
  Rig r(Cfg(3));

  for (int i = 0; i < 3; ++i) r.d.submit(Scene());

  r.d.on_worker_result(2, 3, SolidFrame(3));
  Check(r.d.publish_freshest(), "r.d.publish_freshest()", __LINE__);

  r.d.on_worker_result(0, 1, SolidFrame(1));
  r.d.on_worker_result(1, 2, SolidFrame(2));
  Check(!r.d.publish_freshest(), "!r.d.publish_freshest()", __LINE__);
  Check(r.tb.latest_index() == 3, "r.tb.latest_index() == 3", __LINE__);
  Check(r.fq.size() == 0, "r.fq.size() == 0", __LINE__);
  Check(r.fq.stale_total() == 2, "r.fq.stale_total() == 2", __LINE__);
}

static void RetriesThenAbandons() {
  std::cout << "[dispatcher] failing request is retried retry_limit times, then abandoned\n";
  Rig r(Cfg(2, 8, 2));

  const auto idx = r.d.submit(Scene());
  Check(r.d.assigned_worker(idx) == std::optional<std::size_t>(0), "r.d.assigned_worker(idx) == std::optional<std::size_t>(0)", __LINE__);

  r.d.on_worker_failure(0, idx, "boom");
  // Retried on the other worker
  Check(r.d.retries_total() == 1, "r.d.retries_total() == 1", __LINE__);
  Check(r.d.assigned_worker(idx) == std::optional<std::size_t>(1), "r.d.assigned_worker(idx) == std::optional<std::size_t>(1)", __LINE__);

  r.d.on_worker_failure(1, idx, "boom");
  Check(r.d.retries_total() == 2, "r.d.retries_total() == 2", __LINE__);
  Check(r.d.assigned_worker(idx) == std::optional<std::size_t>(0), "r.d.assigned_worker(idx) == std::optional<std::size_t>(0)", __LINE__);

  r.d.on_worker_failure(0, idx, "boom");
  Check(r.d.retries_total() == 2, "r.d.retries_total() == 2", __LINE__);
  Check(r.d.abandoned_total() == 1, "r.d.abandoned_total() == 1", __LINE__);
  Check(r.d.failures_total() == 3, "r.d.failures_total() == 3", __LINE__);
  Check(!r.d.assigned_worker(idx).has_value(), "!r.d.assigned_worker(idx).has_value()", __LINE__);
  Check(r.d.outstanding() == 0, "r.d.outstanding() == 0", __LINE__);
  Check(r.pool.idle_count() == 2, "r.pool.idle_count() == 2", __LINE__);

  // A result that shows up for the abandoned index is thrown away
  r.d.on_worker_result(1, idx, SolidFrame(idx));
  Check(r.d.late_results_total() == 1, "r.d.late_results_total() == 1", __LINE__);
  Check(r.d.completed_total() == 0, "r.d.completed_total() == 0", __LINE__);
  Check(r.fq.size() == 0, "r.fq.size() == 0", __LINE__);
  Check(!r.d.publish_freshest(), "!r.d.publish_freshest()", __LINE__);
}

static void ZeroRetryLimitAbandonsImmediately() {
  std::cout << "[dispatcher] retry_limit 0\n";
  Rig r(Cfg(1, 8, 0));

  const auto idx = r.d.submit(Scene());
  r.d.on_worker_failure(0, idx);
  Check(r.d.retries_total() == 0, "r.d.retries_total() == 0", __LINE__);
  Check(r.d.abandoned_total() == 1, "r.d.abandoned_total() == 1", __LINE__);
}

static void RetryGoesAheadOfQueuedWork() {
  std::cout << "[dispatcher] retried request is served before newer pending ones\n";
  Rig r(Cfg(1));

  const auto a = r.d.submit(Scene());
  const auto b = r.d.submit(Scene());

  r.d.on_worker_failure(0, a);
  // Only one worker, so the avoid hint falls back to it; 'a' still goes first
  Check(r.d.assigned_worker(a) == std::optional<std::size_t>(0), "r.d.assigned_worker(a) == std::optional<std::size_t>(0)", __LINE__);
  Check(!r.d.assigned_worker(b).has_value(), "!r.d.assigned_worker(b).has_value()", __LINE__);
  Check(r.d.pending_count() == 1, "r.d.pending_count() == 1", __LINE__);
}

static void TimeoutsAreRetried() {
  std::cout << "[dispatcher] timed-out request goes to another worker\n";
  Rig r(Cfg(2, 8, 2, 50));

  const auto idx = r.d.submit(Scene());
  Check(r.d.check_timeouts(tfp::Clock::now()) == 0, "r.d.check_timeouts(tfp::Clock::now()) == 0", __LINE__);

  Check(r.d.check_timeouts(tfp::Clock::now() + 1s) == 1, "r.d.check_timeouts(tfp::Clock::now() + 1s) == 1", __LINE__);
  Check(r.d.timeouts_total() == 1, "r.d.timeouts_total() == 1", __LINE__);
  Check(r.d.retries_total() == 1, "r.d.retries_total() == 1", __LINE__);
  Check(r.d.assigned_worker(idx) == std::optional<std::size_t>(1), "r.d.assigned_worker(idx) == std::optional<std::size_t>(1)", __LINE__);

  // The slow worker finally answers: it still counts, and worker 1's copy becomes redundant
  r.d.on_worker_result(0, idx, SolidFrame(idx));
  Check(r.d.completed_total() == 1, "r.d.completed_total() == 1", __LINE__);
  Check(r.d.in_flight_count() == 0, "r.d.in_flight_count() == 0", __LINE__);
  Check(r.pool.idle_count() == 2, "r.pool.idle_count() == 2", __LINE__);

  // Worker 1 then reports too
  r.d.on_worker_result(1, idx, SolidFrame(idx));
  Check(r.d.late_results_total() == 1, "r.d.late_results_total() == 1", __LINE__);
  Check(r.fq.inserted_total() == 1, "r.fq.inserted_total() == 1", __LINE__);
}

static void StaleFailureIgnored() {
  std::cout << "[dispatcher] failure from a worker no longer charged with the index\n";
  Rig r(Cfg(2, 8, 2, 50));

  const auto idx = r.d.submit(Scene());
  r.d.check_timeouts(tfp::Clock::now() + 1s);
  Check(r.d.assigned_worker(idx) == std::optional<std::size_t>(1), "r.d.assigned_worker(idx) == std::optional<std::size_t>(1)", __LINE__);

  r.d.on_worker_failure(0, idx, "gave up");
  Check(r.d.retries_total() == 1, "r.d.retries_total() == 1", __LINE__);
  Check(r.d.assigned_worker(idx) == std::optional<std::size_t>(1), "r.d.assigned_worker(idx) == std::optional<std::size_t>(1)", __LINE__);
  Check(r.d.late_results_total() == 1, "r.d.late_results_total() == 1", __LINE__);
}

static void MismatchedResultIsFailure() {
  std::cout << "[dispatcher] result without a matching frame\n";
  Rig r(Cfg(1, 8, 1));

  const auto idx = r.d.submit(Scene());
  r.d.on_worker_result(0, idx, nullptr);
  Check(r.d.failures_total() == 1, "r.d.failures_total() == 1", __LINE__);
  Check(r.d.retries_total() == 1, "r.d.retries_total() == 1", __LINE__);

  r.d.on_worker_result(0, idx, SolidFrame(idx + 10));
  Check(r.d.abandoned_total() == 1, "r.d.abandoned_total() == 1", __LINE__);
}

static void EventsAreRouted() {
  std::cout << "[dispatcher] handle_event\n";
  Rig r(Cfg(1));

  const auto idx = r.d.submit(Scene());
  tfp::WorkerEvent ev;
  ev.kind = tfp::WorkerEventKind::Completed;
  ev.worker_id = 0;
  ev.index = idx;
  ev.frame = SolidFrame(idx);
  r.d.handle_event(std::move(ev));
  Check(r.d.completed_total() == 1, "r.d.completed_total() == 1", __LINE__);
}

static void TopUpRespectsCapacity() {
  std::cout << "[dispatcher] scene source tops up to queue_capacity outstanding\n";
  Rig r(Cfg(2, 3));

  std::vector<std::uint64_t> asked;
  r.d.set_scene_source([&asked](std::uint64_t index) {
    asked.push_back(index);
    tfp::SceneState s = Scene();
    s.frame_no = index;
    return s;
  });

  Check(r.d.top_up() == 3, "r.d.top_up() == 3", __LINE__);
  Check(r.d.outstanding() == 3, "r.d.outstanding() == 3", __LINE__);
  Check(!r.d.has_capacity(), "!r.d.has_capacity()", __LINE__);
  Check(r.d.top_up() == 0, "r.d.top_up() == 0", __LINE__);
  Check((asked == std::vector<std::uint64_t>{1, 2, 3}), "(asked == std::vector<std::uint64_t>{1, 2, 3})", __LINE__);

  r.d.on_worker_result(0, 1, SolidFrame(1));
  Check(r.d.has_capacity(), "r.d.has_capacity()", __LINE__);
  Check(r.d.top_up() == 1, "r.d.top_up() == 1", __LINE__);
  Check(asked.back() == 4, "asked.back() == 4", __LINE__);
}

// One worker stuck on index 1, a producer far faster than it. Outstanding work stays at queue_capacity
// and the survivors are the newest submissions
static void SubmitPastCapacityDropsOldestPending() {
  std::cout << "[dispatcher] submit beyond queue_capacity drops the oldest untried request\n";
  Rig r(Cfg(1, 4));

  for (int i = 0; i < 1000; ++i) r.d.submit(Scene());
  Check(r.d.submitted_total() == 1000, "r.d.submitted_total() == 1000", __LINE__);
  Check(r.d.outstanding() == 4, "r.d.outstanding() == 4", __LINE__);
  Check(r.d.in_flight_count() == 1, "r.d.in_flight_count() == 1", __LINE__);
  Check(r.d.pending_count() == 3, "r.d.pending_count() == 3", __LINE__);
  Check(r.d.dropped_requests_total() == 996, "r.d.dropped_requests_total() == 996", __LINE__);

  // Worker frees up and takes the oldest survivor
  r.d.on_worker_result(0, 1, SolidFrame(1));
  Check(r.d.assigned_worker(998) == std::optional<std::size_t>(0), "r.d.assigned_worker(998) == std::optional<std::size_t>(0)", __LINE__);
  Check(r.d.pending_count() == 2, "r.d.pending_count() == 2", __LINE__);
}

int main() {
  IndicesAreSequential();
  QueuesWhenNoWorkerIdle();
  RoundRobinAssignment();
  OutOfOrderCompletionPublishesFreshest();
  LateArrivalAfterPublishIsStale();
  RetriesThenAbandons();
  ZeroRetryLimitAbandonsImmediately();
  RetryGoesAheadOfQueuedWork();
  TimeoutsAreRetried();
  StaleFailureIgnored();
  MismatchedResultIsFailure();
  EventsAreRouted();
  TopUpRespectsCapacity();
  SubmitPastCapacityDropsOldestPending();
  return tfp_test::Finish("dispatcher_test");
}
