#pragma once

#include "dnl/shared.hpp"
#include "spldl.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <ostream>
#include <queue>
#include <stop_token>
#include <vector>

namespace spldl {
class thread_logger;
}

namespace spldl::dnl {

struct collect_result {
  std::size_t              next_index    = 0; // == total_pages when complete
  std::size_t              pages_written = 0;
  std::size_t              bytes_written = 0;
  std::vector<std::size_t> held; // arrived, but never written because of an earlier gap. sorted
};

// Reorders pages arriving in any order into strict index order, and passes each payload
// to `write_fn` exactly once. Pages ahead of `next_index` wait in a priority_queue until
// the gap before them is filled.
//
// Single threaded: only the thread calling run() / accept() touches the holding queue.

class ordered_collector {
public:
  ordered_collector(std::size_t total_pages, write_fn_t write_fn, const thread_logger& logger,
                    std::ostream* progress_os = nullptr);

  // consume `pages` until it is closed and drained, or stop is requested
  collect_result run(page_queue_t& pages, std::stop_token stoken = {});

  void                          accept(page&& pg);
  [[nodiscard]] collect_result result() const;

  [[nodiscard]] std::size_t next_index() const { return next_index_; }
  [[nodiscard]] std::size_t held_size() const { return process_queue_.size(); }

private:
  using clk = std::chrono::steady_clock;

  void write(const page& pg);
  void print_progress(bool force = false);

  struct index_greater {
    bool operator()(const page& a, const page& b) const {
      return a > b; // smallest first (logic inverted in std::priority_queue)
    }
  };

  std::size_t          total_pages_;
  write_fn_t           write_fn_;
  const thread_logger& logger_; // NOLINT reference
  std::ostream*        progress_os_;

  std::priority_queue<page, std::vector<page>, index_greater> process_queue_;

  std::size_t next_index_    = 0;
  std::size_t pages_written_ = 0;
  std::size_t bytes_written_ = 0;

  clk::time_point start_time_;
  clk::time_point last_progress_;
};

} // namespace spldl::dnl
