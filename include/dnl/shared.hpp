#pragma once

#include "dnl/queue.hpp"
#include "errors.hpp"
#include "spldl.hpp"
#include <cstddef>
#include <fmt/format.h>
#include <functional>
#include <ostream>
#include <string>

namespace spldl::dnl {

// prefer use of std::function (ie stdlib type erasure) rather than templates to keep .hpp interface
// clean

// receives page payloads in index order
using write_fn_t = std::function<void(const std::string&)>;

// fetch one decoded page
using fetch_fn_t = std::function<std::string(std::size_t page_index)>;

using index_queue_t = bounded_queue<std::size_t>;
using page_queue_t  = bounded_queue<page>;

// the remote job service, as far as the download engine is concerned
struct job_api {
  std::function<job_status(const std::string& sid)> get_job_status;
  std::function<std::string(const std::string& sid, std::size_t count, std::size_t page_index,
                            output_format format)>
                                                    get_job_results;
  std::function<void(const std::string& sid)>       delete_search_job;
};

struct config_t {
  std::string   sid;
  std::string   output_filename;
  output_format format           = output_format::raw;
  std::size_t   concurrency      = 8;
  bool          delete_when_done = false;
  bool          progress         = false;
  std::size_t   queue_capacity   = 100; // for both the index and the page queue
};

// writes payloads verbatim to a stream, failing loudly

struct text_writer {
  explicit text_writer(std::ostream& os) : os_(os) {}
  void write(const std::string& payload) {
    os_.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    if (!os_) {
      throw error(fmt::format("write of {} bytes to output failed", payload.size()));
    }
  }

private:
  std::ostream& os_; // NOLINT reference
};

} // namespace spldl::dnl
