#pragma once

#include "spldl.hpp"

namespace spldl::dnl {

// pre-flight check before any page is fetched. Returns `status` unchanged or throws
// not_complete, job_failed or result_limit_exceeded.
const job_status& check_readiness(const job_status& status);

} // namespace spldl::dnl
