#include "dnl/readiness.hpp"
#include "errors.hpp"
#include "spldl.hpp"
#include <fmt/format.h>

namespace spldl::dnl {

const job_status& check_readiness(const job_status& status) {
  if (!status.is_done) {
    throw not_complete(fmt::format("job {} is not complete (state: {}, progress: {:.1f}%)",
                                   status.sid, status.dispatch_state,
                                   status.done_progress * 100));
  }

  if (status.is_failed) {
    throw job_failed(fmt::format("job {} has failed", status.sid));
  }

  if (status.result_count > result_limit) {
    throw result_limit_exceeded(
        fmt::format("job {} has more than {} results ({}). Split your search into multiple jobs.",
                    status.sid, result_limit, status.result_count));
  }
  return status;
}

} // namespace spldl::dnl
