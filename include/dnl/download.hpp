#pragma once

#include "dnl/shared.hpp"
#include "errors.hpp"
#include "spldl.hpp"
#include <cstddef>
#include <optional>
#include <ostream>
#include <stop_token>
#include <string>

namespace spldl {
class thread_logger;
}

namespace spldl::dnl {

struct download_report {
  download_plan                plan;
  std::size_t                  pages_written = 0;
  std::size_t                  bytes_written = 0;
  std::optional<cleanup_error> cleanup_failure; // set if delete_when_done and the delete failed
};

// throws if concurrency is 0
download_plan make_plan(const job_status& status, const config_t& cfg);

// fetch the job status, run it through check_readiness() and compute the plan.
// nothing has been fetched or written when this throws
download_plan prepare(const config_t& cfg, const job_api& api, const thread_logger& logger);

// fetch all pages of `plan` concurrently and pass them to `write_fn` in order.
// Throws reassembly_incomplete naming the missing pages if any page could not be fetched,
// cancelled if `stoken` was triggered, or rethrows an exception from the collector / workers.
// Deletes the job afterwards if the plan says so.
download_report run(const download_plan& plan, const job_api& api, const write_fn_t& write_fn,
                    const thread_logger& logger, std::stop_token stoken = {},
                    std::size_t queue_capacity = 100, std::ostream* progress_os = nullptr);

// prepare(), then create cfg.output_filename and run() into it.
// The file is only created once the job has passed its readiness check.
download_report download_to_file(const config_t& cfg, const job_api& api,
                                 const thread_logger& logger, std::stop_token stoken = {},
                                 std::ostream* progress_os = nullptr);

} // namespace spldl::dnl
