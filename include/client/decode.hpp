#pragma once

#include "spldl.hpp"
#include <cstddef>
#include <string>

namespace spldl::client {

// raw: unchanged
std::string decode_raw(const std::string& response);

// csv: the service repeats the header on every page, so drop it from all but page 0
std::string decode_csv(const std::string& response, std::size_t page_index);

// ndjson: one compact json record per line from the `results` array of the envelope.
// throws page_fetch_error if the envelope does not parse
std::string decode_ndjson(const std::string& response, std::size_t page_index);

std::string decode_page(output_format format, const std::string& response,
                        std::size_t page_index);

} // namespace spldl::client
