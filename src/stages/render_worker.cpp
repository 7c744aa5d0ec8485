#include "stages/render_worker.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

namespace tfp {

RenderWorker::RenderWorker(std::size_t id, std::unique_ptr<Renderer> renderer,
                           std::shared_ptr<BoundedQueue<WorkerEvent>> events, StageMetrics* metrics)
    : Stage("worker_" + std::to_string(id)), id_(id), renderer_(std::move(renderer)),
      events_(std::move(events)), metrics_(metrics) {
  if (!renderer_) throw std::invalid_argument("RenderWorker " + std::to_string(id) + ": renderer is null");
  if (!events_) throw std::invalid_argument("RenderWorker " + std::to_string(id) + ": event channel is null");
}

RenderWorker::~RenderWorker() {
  stop();
}

bool RenderWorker::post(RenderRequest request) {
  return mailbox_.try_push(std::move(request));
}

// Checks the renderer's output against what was asked for
static std::string PayloadProblem(const cv::Mat& img, const SceneState& scene) {
  if (img.empty()) return "renderer returned an empty image";
  if (img.type() != CV_8UC4) return "renderer returned a non-CV_8UC4 image";
  if (scene.width > 0 && scene.height > 0 && (img.cols != scene.width || img.rows != scene.height)) {
    return "renderer returned " + std::to_string(img.cols) + "x" + std::to_string(img.rows) +
           ", expected " + std::to_string(scene.width) + "x" + std::to_string(scene.height);
  }
  return {};
}

WorkerEvent RenderWorker::execute(const RenderRequest& request) {
  WorkerEvent ev;
  ev.worker_id = id_;
  ev.index = request.index;

  const auto t0 = std::chrono::steady_clock::now();

  try {
    cv::Mat img = renderer_->render(request);
    std::string problem = PayloadProblem(img, request.scene);

    if (problem.empty()) {
      ev.kind = WorkerEventKind::Completed;
      // A view into memory the renderer keeps reusing must not leave the worker
      if (!img.isContinuous() || img.u == nullptr) img = img.clone();
      ev.frame = MakeFrame(request.index, std::move(img), request.scene.format, id_, request.issued_time);
    } else {
      ev.kind = WorkerEventKind::Failed;
      ev.error = std::move(problem);
    }
  } catch (const std::exception& e) {
    ev.kind = WorkerEventKind::Failed;
    ev.error = e.what();
  }

  const auto work_ns = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - t0).count());
  if (metrics_) {
    if (ev.kind == WorkerEventKind::Completed) metrics_->on_item(work_ns);
    else metrics_->on_failure(work_ns);
  }

  return ev;
}

void RenderWorker::run(const StopToken& global, const std::atomic_bool& local) {
  using namespace std::chrono_literals;

  while (!global.stop_requested() && !local.load(std::memory_order_relaxed)) {
    RenderRequest req;

    // Mailbox wait doubles as the stop-check heartbeat
    if (!mailbox_.try_pop_for(req, 5ms)) continue;

    WorkerEvent ev = execute(req);
    if (ev.kind == WorkerEventKind::Failed) {
      std::cerr << "[" << name() << "] request " << ev.index << " failed: " << ev.error << std::endl;
    }

    // A full channel means the dispatcher is behind; the request then times out and is retried
    if (!events_->try_push(std::move(ev))) {
      std::cerr << "[" << name() << "] event channel full, dropped result for " << req.index << std::endl;
    }
  }
}

} // namespace tfp
