#include "dnl/queuemgt.hpp"
#include "dnl/shared.hpp"
#include "logger.hpp"
#include <chrono>
#include <cstddef>
#include <fmt/chrono.h> // IWYU pragma: keep
#include <fmt/format.h>
#include <mutex>
#include <ostream>
#include <stop_token>
#include <utility>

// queue management
//
// The collector thread is the only consumer of the `page_queue` which the worker threads
// fill in whatever order their fetches complete. There are 2 queues:
//
// 1. `page_queue` (owned by the orchestrator), a bounded_queue shared with the workers. It
// is the minimal communication interface between the threads. When it is full, workers
// block, which bounds memory.
//
// 2. The `process_queue` is a std::priority_queue, private to the collector, which reorders
// the pages into index order. Items are only removed when `next_index_` is at top().
//
// A page that never arrives (its fetch failed) leaves everything after it stuck in the
// process_queue. That shows up in the result as `next_index < total_pages`.

namespace spldl::dnl {

ordered_collector::ordered_collector(std::size_t total_pages, write_fn_t write_fn,
                                     const thread_logger& logger, std::ostream* progress_os)
    : total_pages_(total_pages), write_fn_(std::move(write_fn)), logger_(logger),
      progress_os_(progress_os), start_time_(clk::now()), last_progress_(start_time_) {}

void ordered_collector::write(const page& pg) {
  write_fn_(pg.payload);
  logger_.debug(fmt::format("wrote page {}, {} bytes", pg.index, pg.payload.size()));
  bytes_written_ += pg.payload.size();
  ++pages_written_;
  ++next_index_;
}

void ordered_collector::accept(page&& pg) {
  logger_.debug(fmt::format("received page {}, expecting {}, holding {}", pg.index, next_index_,
                            process_queue_.size()));

  if (pg.index < next_index_) {
    logger_.warn(fmt::format("page {} received twice, ignoring", pg.index));
    return;
  }

  if (pg.index == next_index_) {
    write(pg);
  } else {
    logger_.debug(fmt::format("holding out-of-order page {}", pg.index));
    process_queue_.emplace(std::move(pg));
    return;
  }

  // now anything that was waiting for this one
  while (!process_queue_.empty()) {
    const auto& top = process_queue_.top();
    if (top.index < next_index_) {
      logger_.warn(fmt::format("page {} received twice, ignoring", top.index));
      process_queue_.pop();
      continue;
    }
    if (top.index != next_index_) {
      break; // must wait for an earlier page to preserve the correct order
    }
    write(top);
    process_queue_.pop();
  }
}

collect_result ordered_collector::run(page_queue_t& pages, std::stop_token stoken) { // NOLINT
  logger_.debug(fmt::format("collector started, expecting {} pages", total_pages_));

  while (auto pg = pages.pop(stoken)) {
    accept(std::move(*pg));
    print_progress();
  }
  if (stoken.stop_requested()) {
    logger_.debug("stop request received: bailing out");
  }
  print_progress(true);
  if (progress_os_ != nullptr) {
    const std::lock_guard lk(logger_.stream_mutex());
    *progress_os_ << "\n"; // clear line after progress if being shown, bit nasty
  }

  logger_.debug(fmt::format("collector finished: {} pages written, {} held", pages_written_,
                            process_queue_.size()));
  return result();
}

collect_result ordered_collector::result() const {
  collect_result res;
  res.next_index    = next_index_;
  res.pages_written = pages_written_;
  res.bytes_written = bytes_written_;

  auto held = process_queue_;
  while (!held.empty()) {
    res.held.push_back(held.top().index);
    held.pop();
  }
  return res;
}

void ordered_collector::print_progress(bool force) {
  if (progress_os_ == nullptr) return;

  auto now = clk::now();
  if (!force && now - last_progress_ < std::chrono::milliseconds(200)) return;
  last_progress_ = now;

  auto elapsed       = now - start_time_;
  auto elapsed_trunc = floor<std::chrono::seconds>(elapsed);
  auto elapsed_sec   = duration_cast<std::chrono::duration<double>>(elapsed).count();
  if (elapsed_sec <= 0.0) elapsed_sec = 1e-9;

  const std::lock_guard lk(logger_.stream_mutex());
  *progress_os_ << fmt::format("Elapsed: {:%H:%M:%S}  Progress: {} / {} pages  {:.1f}MB/s  "
                               "{:5.1f}%    Holding: {:4d}\r",
                               elapsed_trunc, pages_written_, total_pages_,
                               static_cast<double>(bytes_written_) / (1U << 20U) / elapsed_sec,
                               100.0 * static_cast<double>(pages_written_) /
                                   static_cast<double>(total_pages_),
                               process_queue_.size());
}

} // namespace spldl::dnl
