#include "infra/thread_runner.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace tfp {

// Longest uninterrupted sleep; bounds how late a stop request is noticed
static constexpr auto kSleepSlice = std::chrono::milliseconds(5);

ThreadRunner::ThreadRunner(std::string name) : name_(std::move(name)) {}

ThreadRunner::~ThreadRunner() {
  request_stop();
  if (thread_.joinable()) thread_.join();
}

void ThreadRunner::start(StopToken global_stop, Fn fn) {
  if (thread_.joinable()) {
    throw std::runtime_error("ThreadRunner '" + name_ + "' already started");
  }

  local_stop_.store(false, std::memory_order_relaxed);
  finished_.store(false, std::memory_order_relaxed);
  failed_.store(false, std::memory_order_relaxed);
  global_stop_ = std::move(global_stop);

  thread_ = std::thread([this, fn = std::move(fn)]() mutable {
    try {
      fn(global_stop_, local_stop_);
    } catch (const std::exception& e) {
      failed_.store(true, std::memory_order_release);
      std::cerr << "[" << name_ << "] thread exited with error: " << e.what() << std::endl;
    }
    finished_.store(true, std::memory_order_release);
  });
}

void ThreadRunner::request_stop() {
  local_stop_.store(true, std::memory_order_relaxed);
}

bool ThreadRunner::stop_requested() const {
  return global_stop_.stop_requested() || local_stop_.load(std::memory_order_relaxed);
}

void ThreadRunner::join() {
  if (thread_.joinable()) thread_.join();
}

bool ThreadRunner::joinable() const {
  return thread_.joinable();
}

bool ThreadRunner::SleepUntil(std::chrono::steady_clock::time_point deadline,
                              const StopToken& global_stop,
                              const std::atomic_bool& local_stop) {
  while (true) {
    if (global_stop.stop_requested() || local_stop.load(std::memory_order_relaxed)) return false;

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return true;

    const auto remaining = std::chrono::duration_cast<std::chrono::steady_clock::duration>(deadline - now);
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(remaining, kSleepSlice));
  }
}

} // namespace tfp
