#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace spldl {

// base of everything this library throws on purpose
struct error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// pre-flight: job not ready for download
struct not_complete : error {
  using error::error;
};

struct job_failed : error {
  using error::error;
};

struct result_limit_exceeded : error {
  using error::error;
};

// transport failure, curl error or HTTP status >= 400
struct http_error : error {
  http_error(const std::string& msg, long status_ = 0) : error(msg), status(status_) {}

  long status; // 0 when no response was received
};

// one page could not be retrieved or decoded
struct page_fetch_error : error {
  page_fetch_error(const std::string& msg, std::size_t index_) : error(msg), index(index_) {}

  std::size_t index;
};

// collector ran out of pages before reaching total_pages
struct reassembly_incomplete : error {
  reassembly_incomplete(const std::string& msg, std::vector<std::size_t> missing_)
      : error(msg), missing(std::move(missing_)) {}

  std::vector<std::size_t> missing;
};

// deleting the job after download failed
struct cleanup_error : error {
  using error::error;
};

struct cancelled : error {
  using error::error;
};

} // namespace spldl
