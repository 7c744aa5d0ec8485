#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>

#include "infra/stop_token.hpp"

/*
    ThreadRunner owns exactly one thread of the pipeline (a worker, the dispatcher or the display loop).
    It provides:
        - consistent start/stop/join behavior
        - a local stop flag for stopping just this thread
        - read-only access to the pipeline-wide stop flag
        - a record of whether the thread body exited by throwing (logged, never rethrown across threads)
*/

namespace tfp {

class ThreadRunner {
public:
  // Any callable that takes the global stop token and the local stop flag, and returns nothing
  using Fn = std::function<void(const StopToken&, const std::atomic_bool&)>;

  ThreadRunner() = default;
  explicit ThreadRunner(std::string name);

  ThreadRunner(const ThreadRunner&) = delete;
  ThreadRunner& operator=(const ThreadRunner&) = delete;

  ~ThreadRunner();

  // Throws std::runtime_error if the thread is already running
  void start(StopToken global_stop, Fn fn);

  // Request this specific thread to stop. Does NOT affect other threads
  void request_stop();
  // True if either the global or the local stop flag is set
  bool stop_requested() const;

  void join();
  bool joinable() const;

  // Set once fn has returned (normally or by exception)
  bool finished() const { return finished_.load(std::memory_order_acquire); }
  bool failed() const { return failed_.load(std::memory_order_acquire); }

  const std::string& name() const { return name_; }

  // Sleeps until 'deadline' in short slices. Returns false as soon as a stop is requested
  static bool SleepUntil(std::chrono::steady_clock::time_point deadline,
                         const StopToken& global_stop,
                         const std::atomic_bool& local_stop);

private:
  std::thread thread_;
  std::atomic_bool local_stop_{false};
  std::atomic_bool finished_{false};
  std::atomic_bool failed_{false};
  StopToken global_stop_{};
  std::string name_{"thread"};
};

} // namespace tfp
