#include "dnl/download.hpp"
#include "dnl/queuemgt.hpp"
#include "dnl/readiness.hpp"
#include "dnl/shared.hpp"
#include "dnl/workers.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "spldl.hpp"
#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <exception>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fstream>
#include <ios>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace spldl::dnl {

namespace {

bool handle_exception(const std::exception_ptr& exception_ptr, const std::string& thrname,
                      const thread_logger& logger) {
  if (exception_ptr) {
    try {
      std::rethrow_exception(exception_ptr);
    } catch (const std::exception& e) {
      logger.error(fmt::format("Caught exception in {} thread: {}", thrname, e.what()));
    }
    return true;
  }
  return false;
}

// indices in [next_index, total_pages) which never reached the collector
std::vector<std::size_t> find_missing(const collect_result& collected, std::size_t total_pages) {
  std::vector<std::size_t> missing;
  for (std::size_t i = collected.next_index; i != total_pages; ++i) {
    if (!std::binary_search(collected.held.begin(), collected.held.end(), i)) {
      missing.push_back(i);
    }
  }
  return missing;
}

void cleanup(const download_plan& plan, const job_api& api, download_report& report,
             const thread_logger& logger) {
  logger.debug(fmt::format("Deleting search job {}", plan.sid));
  try {
    api.delete_search_job(plan.sid);
    logger.debug(fmt::format("Search job {} deleted successfully", plan.sid));
  } catch (const std::exception& e) {
    // the download itself stands
    report.cleanup_failure.emplace(
        fmt::format("failed to delete job {}: {}", plan.sid, e.what()));
    logger.warn(report.cleanup_failure->what());
  }
}

} // namespace

download_plan make_plan(const job_status& status, const config_t& cfg) {
  if (cfg.concurrency == 0) {
    throw error("concurrency (max connections) must be at least 1");
  }
  download_plan plan;
  plan.sid              = cfg.sid;
  plan.page_size        = page_size;
  plan.total_pages      = total_pages(status.result_count);
  plan.concurrency      = cfg.concurrency;
  plan.format           = cfg.format;
  plan.delete_when_done = cfg.delete_when_done;
  return plan;
}

download_plan prepare(const config_t& cfg, const job_api& api, const thread_logger& logger) {
  logger.debug(fmt::format("Starting download process: sid {} output_mode {} max_connections {}",
                           cfg.sid, to_string(cfg.format), cfg.concurrency));

  job_status status;
  try {
    status = api.get_job_status(cfg.sid);
  } catch (const error& e) {
    throw error(fmt::format("failed to get job status: {}", e.what()));
  }
  if (status.sid.empty()) status.sid = cfg.sid;

  logger.info(fmt::format("Job status retrieved: sid {} result_count {} dispatch_state {} "
                          "is_done {} is_failed {}",
                          status.sid, status.result_count, status.dispatch_state, status.is_done,
                          status.is_failed));

  check_readiness(status);
  return make_plan(status, cfg);
}

download_report run(const download_plan& plan, const job_api& api, const write_fn_t& write_fn,
                    const thread_logger& logger, std::stop_token stoken, // NOLINT stoken
                    std::size_t queue_capacity, std::ostream* progress_os) {

  logger.info(fmt::format("Starting download: total_pages {} page_size {} max_connections {}",
                          plan.total_pages, plan.page_size, plan.concurrency));

  // one stop_source for every thread, tripped by the caller or by any thread that throws
  std::stop_source stop_source;
  auto             forward_stop = std::stop_callback(stoken, [&] { stop_source.request_stop(); });

  index_queue_t indices(queue_capacity);
  page_queue_t  pages(queue_capacity);

  const fetch_fn_t fetch = [&](std::size_t page_index) {
    return api.get_job_results(plan.sid, plan.page_size, page_index, plan.format);
  };

  ordered_collector collector(plan.total_pages, write_fn, logger, progress_os);
  collect_result    collected;

  std::exception_ptr       collector_exception;
  std::exception_ptr       workers_exception;
  std::vector<std::size_t> failed;

  logger.name_thread("main");
  {
    std::jthread collector_thread([&]() {
      logger.name_thread("collector");
      try {
        collected = collector.run(pages, stop_source.get_token());
      } catch (...) {
        collector_exception = std::current_exception();
        logger.debug("exception caught: requesting stop of workers via stop_source");
        stop_source.request_stop();
      }
    });

    std::optional<worker_pool> pool;
    try {
      pool.emplace(plan.concurrency, fetch, indices, pages, logger, stop_source);

      logger.debug("Dispatching page indices to workers");
      for (std::size_t i = 0; i != plan.total_pages; ++i) {
        if (!indices.push(i, stop_source.get_token())) break;
      }
      indices.close();
      logger.debug("All page indices dispatched, waiting for workers");

      pool->join();
    } catch (...) {
      stop_source.request_stop(); // release workers and collector before rethrowing
      indices.close();
      pool.reset();
      throw;
    }
    failed            = pool->failed_indices();
    workers_exception = pool->exception();
    logger.debug(fmt::format("All workers completed: {} pages fetched, {} failed",
                             pool->pages_fetched(), failed.size()));
    pages.close();
  } // wait here until collector joins
  logger.debug("Collector finished");

  // use temps to avoid short cct eval
  const bool ex_collector = handle_exception(collector_exception, "collector", logger);
  const bool ex_workers   = handle_exception(workers_exception, "worker", logger);
  if (ex_collector) std::rethrow_exception(collector_exception);
  if (ex_workers) std::rethrow_exception(workers_exception);

  if (stoken.stop_requested()) {
    throw cancelled(fmt::format("download of job {} cancelled after {} of {} pages", plan.sid,
                                collected.pages_written, plan.total_pages));
  }

  if (collected.next_index != plan.total_pages) {
    auto missing = find_missing(collected, plan.total_pages);
    throw reassembly_incomplete(
        fmt::format("download of job {} is incomplete: wrote {} of {} pages. Missing page(s): "
                    "{}. {} later page(s) could not be written after the gap.",
                    plan.sid, collected.pages_written, plan.total_pages,
                    fmt::join(missing, ", "), collected.held.size()),
        missing);
  }
  download_report report;
  report.plan          = plan;
  report.pages_written = collected.pages_written;
  report.bytes_written = collected.bytes_written;

  if (plan.delete_when_done) cleanup(plan, api, report, logger);
  return report;
}

download_report download_to_file(const config_t& cfg, const job_api& api,
                                 const thread_logger& logger, std::stop_token stoken,
                                 std::ostream* progress_os) {
  auto plan = prepare(cfg, api, logger);

  auto output_stream = std::ofstream(cfg.output_filename, std::ios_base::binary);
  if (!output_stream) {
    throw error(fmt::format("Error opening '{}' for writing. Because: \"{}\".",
                            cfg.output_filename,
                            std::strerror(errno))); // NOLINT errno
  }
  logger.debug(fmt::format("Writing to {}", cfg.output_filename));

  auto tw     = text_writer(output_stream);
  auto report = run(
      plan, api, [&](const std::string& payload) { tw.write(payload); }, logger, stoken,
      cfg.queue_capacity, cfg.progress ? progress_os : nullptr);

  output_stream.close();
  if (!output_stream) {
    throw error(fmt::format("Error closing '{}'.", cfg.output_filename));
  }

  logger.info(fmt::format("Download completed successfully: sid {} filename {} pages {} bytes {}",
                          plan.sid, cfg.output_filename, report.pages_written,
                          report.bytes_written));
  return report;
}

} // namespace spldl::dnl
