#pragma once

#include <atomic>
#include <string>

#include "infra/stop_token.hpp"
#include "infra/thread_runner.hpp"

/*
    One pipeline thread with a name. The pipeline runs 1 + N + 1 of them:
      - "dispatcher": hands out indices, collects results, publishes into the triple buffer
      - "worker_<i>": renders one request at a time out of its mailbox
      - "display": presents the front buffer at the target rate

    Each run() loop polls both stop flags between units of work. global_stop is the pipeline-wide token
    (Pipeline::stop); local_stop is this stage's own flag (request_stop). Loops must never block longer than a
    few milliseconds at a time, so stop() returns promptly.
*/

namespace tfp {

class Stage {
public:
  explicit Stage(std::string name);
  // Does not join. A subclass whose run() touches its own members calls stop() in its destructor
  virtual ~Stage();

  Stage(const Stage&) = delete;
  Stage& operator=(const Stage&) = delete;

  // Logs "[name] started" and spawns the thread. Throws if already started
  void start(StopToken global_stop);

  // Sets local_stop without waiting. WorkerPool uses it to signal every worker before joining any
  void request_stop();
  // request_stop() + join. Safe to call more than once, or on a stage that never started
  void stop();

  // False before start() and once run() has returned
  bool running() const;

  const std::string& name() const { return name_; }

protected:
  virtual void run(const StopToken& global_stop,
                   const std::atomic_bool& local_stop) = 0;

private:
  std::string name_;
  ThreadRunner runner_;
};

} // namespace tfp
