#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace spldl::dnl {

// fixed capacity, closeable, multi producer / multi consumer queue
// all waits can be interrupted by a std::stop_token

template <typename T>
class bounded_queue {
public:
  explicit bounded_queue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  bounded_queue(const bounded_queue&)            = delete;
  bounded_queue& operator=(const bounded_queue&) = delete;

  // blocks while full. Returns false, and drops `item`, if the queue was closed or stop was
  // requested before there was room
  bool push(T item, std::stop_token stoken = {}) { // NOLINT stoken
    {
      std::unique_lock lk(mutex_);
      cv_push_.wait(lk, stoken, [&] { return queue_.size() < capacity_ || closed_; });
      if (closed_ || stoken.stop_requested()) return false;
      queue_.emplace_back(std::move(item));
    }
    cv_pop_.notify_one();
    return true;
  }

  // blocks while empty. Returns nullopt once the queue is closed and drained, or on stop
  std::optional<T> pop(std::stop_token stoken = {}) { // NOLINT stoken
    std::optional<T> item;
    {
      std::unique_lock lk(mutex_);
      cv_pop_.wait(lk, stoken, [&] { return !queue_.empty() || closed_; });
      if (queue_.empty() || stoken.stop_requested()) return std::nullopt;
      item.emplace(std::move(queue_.front()));
      queue_.pop_front();
    }
    cv_push_.notify_one();
    return item;
  }

  // no more pushes. consumers drain what is left, then see nullopt
  void close() {
    {
      const std::lock_guard lk(mutex_);
      closed_ = true;
    }
    cv_pop_.notify_all();
    cv_push_.notify_all();
  }

  [[nodiscard]] bool closed() const {
    const std::lock_guard lk(mutex_);
    return closed_;
  }

  [[nodiscard]] std::size_t size() const {
    const std::lock_guard lk(mutex_);
    return queue_.size();
  }

  [[nodiscard]] std::size_t capacity() const { return capacity_; }

private:
  mutable std::mutex          mutex_;
  std::condition_variable_any cv_push_; // _any for stop_token
  std::condition_variable_any cv_pop_;
  std::deque<T>               queue_;
  std::size_t                 capacity_;
  bool                        closed_ = false;
};

} // namespace spldl::dnl
