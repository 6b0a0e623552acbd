#pragma once

#include <compare>
#include <cstddef>
#include <string>
#include <utility>

namespace spldl {

// number of results requested per page, and the most a single job may hold
constexpr std::size_t page_size    = 10'000;
constexpr std::size_t result_limit = 500'000;

enum class output_format { raw, csv, ndjson };

// "raw", "csv", "ndjson"
std::string   to_string(output_format format);
output_format parse_output_format(const std::string& name);

// value of the `output_mode` query parameter the service expects for each format
std::string output_mode_param(output_format format);

// .txt -> raw, .csv -> csv, .ndjson -> ndjson, anything else throws
output_format format_from_filename(const std::string& filename);

// snapshot of a search job as reported by the service
struct job_status {
  std::string sid;
  std::size_t result_count          = 0;
  bool        is_done               = false;
  bool        is_failed             = false;
  std::string dispatch_state;
  double      done_progress         = 0.0; // 0.0 - 1.0
  std::size_t event_count           = 0;
  std::size_t event_available_count = 0;
  double      run_duration          = 0.0; // seconds
};

// one fixed size slice of the result set
struct page {
  page() = default;
  page(std::size_t index_, std::string payload_) : index(index_), payload(std::move(payload_)) {}

  // used in priority_queue to keep items in order
  std::strong_ordering operator<=>(const page& rhs) const { return index <=> rhs.index; }
  bool                 operator==(const page& rhs) const { return index == rhs.index; }

  std::size_t index = 0;
  std::string payload;
};

// always at least 1, an exact multiple of page_size gives an empty trailing page
constexpr std::size_t total_pages(std::size_t result_count) {
  return result_count / page_size + 1;
}

struct download_plan {
  std::string   sid;
  std::size_t   page_size   = spldl::page_size;
  std::size_t   total_pages = 1;
  std::size_t   concurrency = 1;
  output_format format      = output_format::raw;
  bool          delete_when_done = false;
};

} // namespace spldl
