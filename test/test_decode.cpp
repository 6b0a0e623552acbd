#include "client/decode.hpp"
#include "errors.hpp"
#include "spldl.hpp"
#include "gtest/gtest.h"
#include <cstddef>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

using spldl::client::decode_csv;
using spldl::client::decode_ndjson;
using spldl::client::decode_page;

TEST(decode, raw_is_unchanged) { // NOLINT
  const std::string body = "line 1\r\nline 2\nno newline at end";
  EXPECT_EQ(decode_page(spldl::output_format::raw, body, 0), body);
  EXPECT_EQ(decode_page(spldl::output_format::raw, body, 7), body);
}

TEST(decode, csv_keeps_header_on_first_page_only) { // NOLINT
  EXPECT_EQ(decode_csv("a,b\n1,2\n", 0), "a,b\n1,2\n");
  EXPECT_EQ(decode_csv("a,b\n3,4\n", 1), "3,4\n");
  EXPECT_EQ(decode_csv("a,b\n5,6\n", 12), "5,6\n");
}

TEST(decode, csv_edge_cases) { // NOLINT
  EXPECT_EQ(decode_csv("", 3), "");
  EXPECT_EQ(decode_csv("a,b\n", 3), "");
  EXPECT_EQ(decode_csv("no newline", 3), "no newline");
}

TEST(decode, csv_pages_reconstruct_table) { // NOLINT
  const std::string header = "_time,_raw\n";
  const std::string rows[] = {"1,a\n2,b\n", "3,c\n4,d\n", "5,e\n"};

  std::string joined;
  std::string expected = header;
  for (std::size_t i = 0; i != 3; ++i) {
    joined += decode_csv(header + rows[i], i);
    expected += rows[i];
  }
  EXPECT_EQ(joined, expected);
}

TEST(decode, ndjson_one_compact_record_per_line) { // NOLINT
  const std::string envelope = R"({
    "preview": false,
    "init_offset": 0,
    "messages": [],
    "fields": [{"name": "_raw"}, {"name": "host"}],
    "results": [
      {"host": "web01", "_raw": "GET /index.html"},
      {"host": "web02", "_raw": "POST /login", "tags": ["a", "b"]}
    ]
  })";

  auto out = decode_ndjson(envelope, 0);
  EXPECT_EQ(out, "{\"_raw\":\"GET /index.html\",\"host\":\"web01\"}\n"
                 "{\"_raw\":\"POST /login\",\"host\":\"web02\",\"tags\":[\"a\",\"b\"]}\n");

  std::istringstream lines(out);
  std::size_t        count = 0;
  for (std::string line; std::getline(lines, line);) {
    if (line.empty()) continue;
    EXPECT_NO_THROW({
      auto record = nlohmann::json::parse(line);
      EXPECT_TRUE(record.is_object());
    });
    ++count;
  }
  EXPECT_EQ(count, 2U);
}

TEST(decode, ndjson_empty_or_missing_results) { // NOLINT
  EXPECT_EQ(decode_ndjson(R"({"results": []})", 5), "");
  EXPECT_EQ(decode_ndjson(R"({"preview": false})", 5), "");
  EXPECT_EQ(decode_ndjson(R"({"results": null})", 5), "");
}

TEST(decode, ndjson_bad_envelope_is_page_error) { // NOLINT
  try {
    decode_ndjson("<html>oops</html>", 4);
    FAIL() << "expected page_fetch_error";
  } catch (const spldl::page_fetch_error& e) {
    EXPECT_EQ(e.index, 4U);
  }
  EXPECT_THROW(decode_ndjson("[1, 2]", 4), spldl::page_fetch_error);
  EXPECT_THROW(decode_ndjson(R"({"results": 3})", 4), spldl::page_fetch_error);
}
