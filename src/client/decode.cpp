#include "client/decode.hpp"
#include "errors.hpp"
#include "spldl.hpp"
#include <cstddef>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <string>

namespace spldl::client {

using json = nlohmann::json;

std::string decode_raw(const std::string& response) { return response; }

std::string decode_csv(const std::string& response, std::size_t page_index) {
  if (page_index > 0) {
    if (auto pos = response.find('\n'); pos != std::string::npos) {
      return response.substr(pos + 1);
    }
  }
  return response;
}

std::string decode_ndjson(const std::string& response, std::size_t page_index) {
  json envelope;
  try {
    envelope = json::parse(response);
  } catch (const json::exception& e) {
    throw page_fetch_error(
        fmt::format("page {}: error unmarshalling results envelope: {}", page_index, e.what()),
        page_index);
  }

  if (!envelope.is_object()) {
    throw page_fetch_error(
        fmt::format("page {}: results envelope is not a json object", page_index), page_index);
  }

  const auto it = envelope.find("results");
  if (it == envelope.end() || it->is_null()) {
    return {}; // empty trailing page
  }
  if (!it->is_array()) {
    throw page_fetch_error(fmt::format("page {}: `results` is not an array", page_index),
                           page_index);
  }

  std::string out;
  try {
    for (const auto& result: *it) {
      out += result.dump();
      out += '\n';
    }
  } catch (const json::exception& e) { // invalid utf-8
    throw page_fetch_error(fmt::format("page {}: error marshalling result: {}", page_index,
                                       e.what()),
                           page_index);
  }
  return out;
}

std::string decode_page(output_format format, const std::string& response,
                        std::size_t page_index) {
  switch (format) {
  case output_format::raw:
    return decode_raw(response);
  case output_format::csv:
    return decode_csv(response, page_index);
  case output_format::ndjson:
    return decode_ndjson(response, page_index);
  }
  throw error(fmt::format("decode_page: unknown output format {}", static_cast<int>(format)));
}

} // namespace spldl::client
