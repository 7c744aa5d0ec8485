#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include "core/config.hpp" // For DropPolicy

/*
    FIFO channel with a hard capacity and a drop policy. Push never blocks; pop can wait with a timeout.

    The pipeline has two of them:
      - Worker mailbox, capacity 1, DropOldest. The dispatcher only hands a request to an idle worker, so a
        second push means the first one was never picked up and the newer request replaces it.
      - Event channel, capacity 4 x workers, DropNewest. Results already queued stay in order; a result that
        does not fit is lost and its request later times out in the dispatcher.
*/

namespace tfp {

template <typename T>
class BoundedQueue {
public:
  explicit BoundedQueue(std::size_t capacity, DropPolicy policy): capacity_(capacity), policy_(policy) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // False only when 'item' itself was dropped. Under DropOldest the push succeeds and the head goes instead
  bool try_push(T item) {
    std::unique_lock<std::mutex> lock(mu_);
    ++pushes_;

    if (capacity_ == 0 || (q_.size() >= capacity_ && policy_ == DropPolicy::DropNewest)) {
      ++drops_;
      return false;
    }
    if (q_.size() >= capacity_) {
      q_.pop_front();
      ++drops_;
    }

    q_.push_back(std::move(item));
    lock.unlock();
    cv_.notify_one();
    return true;
  }

  bool try_pop(T& out) {
    std::lock_guard<std::mutex> lock(mu_);
    return pop_front_locked(out);
  }

  // Render workers block here between requests; the timeout is their stop-check interval
  template <typename Rep, typename Period>
  bool try_pop_for(T& out, const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    if (!cv_.wait_for(lock, timeout, [&] { return !q_.empty(); })) return false;
    return pop_front_locked(out);
  }

  // Waits up to 'timeout' for the first item, then moves out what is queued, at most max_items.
  // Returns the number appended to 'out'. The dispatcher loop runs on this: events in batches, and an empty
  // wait still returns in time for the timeout sweep
  template <typename Rep, typename Period>
  std::size_t drain_for(std::vector<T>& out, std::size_t max_items, const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    if (!cv_.wait_for(lock, timeout, [&] { return !q_.empty(); })) return 0;

    std::size_t n = 0;
    while (n < max_items && !q_.empty()) {
      out.push_back(std::move(q_.front()));
      q_.pop_front();
      ++n;
    }
    return n;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return q_.size();
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mu_);
    return q_.empty();
  }

  std::size_t capacity() const { return capacity_; }

  std::uint64_t pushes_total() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pushes_;
  }

  // Mailbox: superseded requests. Event channel: lost results
  std::uint64_t drops_total() const {
    std::lock_guard<std::mutex> lock(mu_);
    return drops_;
  }

private:
  bool pop_front_locked(T& out) {
    if (q_.empty()) return false;
    out = std::move(q_.front());
    q_.pop_front();
    return true;
  }

  const std::size_t capacity_;
  const DropPolicy policy_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<T> q_;

  std::uint64_t pushes_{0};
  std::uint64_t drops_{0};
};

} // namespace tfp
