#pragma once

#include "dnl/shared.hpp"
#include <cstddef>
#include <exception>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace spldl {
class thread_logger;
}

namespace spldl::dnl {

// `concurrency` threads, each repeatedly taking an index from `indices`, fetching it and
// pushing the page onto `pages`. A failed fetch is logged and recorded, and the worker moves
// on. Workers exit when `indices` is closed and drained, or on stop.
//
// Threads start in the constructor. The destructor joins.

class worker_pool {
public:
  worker_pool(std::size_t concurrency, fetch_fn_t fetch, index_queue_t& indices,
              page_queue_t& pages, const thread_logger& logger, std::stop_source stop_source);

  worker_pool(const worker_pool&)            = delete;
  worker_pool& operator=(const worker_pool&) = delete;
  ~worker_pool() { join(); }

  void join();

  // sorted
  [[nodiscard]] std::vector<std::size_t> failed_indices() const;

  // first unexpected exception thrown in a worker, if any
  [[nodiscard]] std::exception_ptr exception() const;

  [[nodiscard]] std::size_t pages_fetched() const;

private:
  void work(std::size_t worker_no, std::stop_token stoken);

  fetch_fn_t           fetch_;
  index_queue_t&       indices_; // NOLINT reference
  page_queue_t&        pages_;   // NOLINT reference
  const thread_logger& logger_;  // NOLINT reference
  std::stop_source     stop_source_;

  mutable std::mutex       mutex_;
  std::vector<std::size_t> failed_;
  std::exception_ptr       exception_;
  std::size_t              fetched_ = 0;

  std::vector<std::jthread> threads_; // last, so all the above is ready before threads start
};

} // namespace spldl::dnl
