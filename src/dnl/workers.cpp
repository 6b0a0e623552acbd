#include "dnl/workers.hpp"
#include "dnl/shared.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cstddef>
#include <exception>
#include <fmt/format.h>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace spldl::dnl {

worker_pool::worker_pool(std::size_t concurrency, fetch_fn_t fetch, index_queue_t& indices,
                         page_queue_t& pages, const thread_logger& logger,
                         std::stop_source stop_source)
    : fetch_(std::move(fetch)), indices_(indices), pages_(pages), logger_(logger),
      stop_source_(std::move(stop_source)) {

  if (concurrency == 0) {
    throw error("worker_pool: concurrency must be at least 1");
  }

  threads_.reserve(concurrency);
  logger_.debug(fmt::format("Starting {} worker threads", concurrency));
  try {
    for (std::size_t i = 0; i != concurrency; ++i) {
      threads_.emplace_back([this, i, stoken = stop_source_.get_token()]() {
        try {
          work(i, stoken);
        } catch (...) {
          {
            const std::lock_guard lk(mutex_);
            if (!exception_) exception_ = std::current_exception();
          }
          logger_.debug("exception caught: requesting stop of all threads via stop_source");
          stop_source_.request_stop();
        }
      });
    }
  } catch (...) {
    // could not start them all. Stop the ones that did start, they are joined on unwind
    stop_source_.request_stop();
    throw;
  }
}

void worker_pool::work(std::size_t worker_no, std::stop_token stoken) { // NOLINT stoken
  logger_.name_thread(fmt::format("worker-{}", worker_no));

  while (auto index = indices_.pop(stoken)) {
    std::string payload;
    try {
      payload = fetch_(*index);
    } catch (const std::exception& e) {
      // no retry. The hole this leaves is reported when reassembly comes up short
      logger_.error(fmt::format("Error getting page {}: {}", *index, e.what()));
      const std::lock_guard lk(mutex_);
      failed_.push_back(*index);
      continue;
    }

    logger_.debug(fmt::format("page {} fetched, {} bytes", *index, payload.size()));
    if (!pages_.push(page{*index, std::move(payload)}, stoken)) {
      logger_.debug(fmt::format("page queue closed or stop requested, dropping page {}", *index));
      break;
    }
    const std::lock_guard lk(mutex_);
    ++fetched_;
  }
  logger_.debug("worker finished");
}

void worker_pool::join() {
  for (auto& thr: threads_) {
    if (thr.joinable()) thr.join();
  }
}

std::vector<std::size_t> worker_pool::failed_indices() const {
  const std::lock_guard lk(mutex_);
  auto                  failed = failed_;
  std::sort(failed.begin(), failed.end());
  return failed;
}

std::exception_ptr worker_pool::exception() const {
  const std::lock_guard lk(mutex_);
  return exception_;
}

std::size_t worker_pool::pages_fetched() const {
  const std::lock_guard lk(mutex_);
  return fetched_;
}

} // namespace spldl::dnl
