#pragma once
#include <atomic>
#include <memory>

/*
    Cooperative shutdown for the pipeline threads.

    A StopSource lives in the PipelineContext and represents "the whole pipeline is shutting down".
    Every worker, the dispatcher and the display loop get a StopToken copied from it. The flag is shared,
    so a token stays valid even if the thread holding it outlives the source during teardown.

    Each thread additionally has its own local stop flag (see ThreadRunner) so a single stage can be
    stopped without touching the others.
*/

namespace tfp {

class StopToken {
public:
  StopToken() = default;
  explicit StopToken(std::shared_ptr<const std::atomic_bool> flag) : flag_(std::move(flag)) {}

  bool stop_requested() const {
    return flag_ && flag_->load(std::memory_order_acquire);
  }

private:
  std::shared_ptr<const std::atomic_bool> flag_;
};

class StopSource {
public:
  StopSource() : stop_(std::make_shared<std::atomic_bool>(false)) {}

  StopSource(const StopSource&) = delete;
  StopSource& operator=(const StopSource&) = delete;

  StopToken token() const { return StopToken(stop_); }

  // Same method names as ThreadRunner so pipeline and stages read alike
  void request_stop() { stop_->store(true, std::memory_order_release); }

  bool stop_requested() const { return stop_->load(std::memory_order_acquire); }

private:
  std::shared_ptr<std::atomic_bool> stop_;
};

} // namespace tfp
