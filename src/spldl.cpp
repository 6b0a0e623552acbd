#include "spldl.hpp"
#include "errors.hpp"
#include <filesystem>
#include <fmt/format.h>
#include <string>

namespace spldl {

std::string to_string(output_format format) {
  switch (format) {
  case output_format::raw:
    return "raw";
  case output_format::csv:
    return "csv";
  case output_format::ndjson:
    return "ndjson";
  }
  throw error("to_string: unknown output_format");
}

output_format parse_output_format(const std::string& name) {
  if (name == "raw") return output_format::raw;
  if (name == "csv") return output_format::csv;
  if (name == "ndjson") return output_format::ndjson;
  throw error(fmt::format("Unknown output format '{}'. Use raw, csv or ndjson.", name));
}

std::string output_mode_param(output_format format) {
  // ndjson is built locally from the json envelope
  return format == output_format::ndjson ? "json" : to_string(format);
}

output_format format_from_filename(const std::string& filename) {
  const auto ext = std::filesystem::path(filename).extension().string();
  if (ext == ".ndjson") return output_format::ndjson;
  if (ext == ".csv") return output_format::csv;
  if (ext == ".txt") return output_format::raw;
  throw error(fmt::format("Output file '{}' must have a .ndjson, .csv, or .txt extension "
                          "(or pass --format).",
                          filename));
}

} // namespace spldl
