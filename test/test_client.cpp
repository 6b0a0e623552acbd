#include "client/splunk_client.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "gtest/gtest.h"
#include <sstream>
#include <string>

using namespace spldl::client; // NOLINT

TEST(client, base_url) { // NOLINT
  client_config cfg;
  cfg.host = "splunk.example.com";
  EXPECT_EQ(make_base_url(cfg), "https://splunk.example.com:8089");

  cfg.use_tls = false;
  cfg.port    = 8090;
  EXPECT_EQ(make_base_url(cfg), "http://splunk.example.com:8090");

  std::stringstream          log;
  const spldl::thread_logger logger(log);
  const splunk_client        client(cfg, logger);
  EXPECT_EQ(client.base_url(), "http://splunk.example.com:8090");
}

TEST(client, encode_query) { // NOLINT
  EXPECT_EQ(encode_query({}), "");
  EXPECT_EQ(encode_query({{"offset", "20000"}, {"count", "10000"}, {"output_mode", "csv"}}),
            "count=10000&offset=20000&output_mode=csv");
  EXPECT_EQ(encode_query({{"search", "search index=main | head 5"}}),
            "search=search%20index%3Dmain%20%7C%20head%205");
}

TEST(client, parse_job_status) { // NOLINT
  const std::string body = R"({
    "entry": [{
      "name": "search index=main",
      "id": "https://localhost:8089/services/search/v2/jobs/1756172871.1180",
      "content": {
        "sid": "1756172871.1180",
        "resultCount": 25000,
        "isDone": true,
        "isFailed": false,
        "dispatchState": "DONE",
        "doneProgress": 1,
        "eventCount": 30000,
        "eventAvailableCount": 25000,
        "runDuration": 12.5,
        "earliestTime": "2025-08-25T00:00:00.000+00:00"
      }
    }]
  })";

  auto status = parse_job_status(body, "1756172871.1180");
  EXPECT_EQ(status.sid, "1756172871.1180");
  EXPECT_EQ(status.result_count, 25'000U);
  EXPECT_TRUE(status.is_done);
  EXPECT_FALSE(status.is_failed);
  EXPECT_EQ(status.dispatch_state, "DONE");
  EXPECT_DOUBLE_EQ(status.done_progress, 1.0);
  EXPECT_EQ(status.event_count, 30'000U);
  EXPECT_EQ(status.event_available_count, 25'000U);
  EXPECT_DOUBLE_EQ(status.run_duration, 12.5);
}

TEST(client, parse_job_status_running) { // NOLINT
  auto status = parse_job_status(
      R"({"entry":[{"content":{"isDone":false,"dispatchState":"RUNNING","doneProgress":0.25}}]})",
      "abc");
  EXPECT_EQ(status.sid, "abc");
  EXPECT_FALSE(status.is_done);
  EXPECT_EQ(status.dispatch_state, "RUNNING");
  EXPECT_DOUBLE_EQ(status.done_progress, 0.25);
  EXPECT_EQ(status.result_count, 0U);
}

TEST(client, parse_job_status_errors) { // NOLINT
  EXPECT_THROW(parse_job_status("not json", "abc"), spldl::error);
  EXPECT_THROW(parse_job_status(R"({"entry": []})", "abc"), spldl::error);
  EXPECT_THROW(parse_job_status(R"({"messages": []})", "abc"), spldl::error);
  EXPECT_THROW(parse_job_status(R"({"entry": [{"name": "x"}]})", "abc"), spldl::error);
  EXPECT_THROW(parse_job_status(R"({"entry":[{"content":{"isDone":"yes"}}]})", "abc"),
               spldl::error);

  try {
    parse_job_status(R"({"entry": []})", "abc");
  } catch (const spldl::error& e) {
    EXPECT_NE(std::string(e.what()).find("no job found for sid abc"), std::string::npos);
  }
}

TEST(client, parse_new_job_sid) { // NOLINT
  EXPECT_EQ(parse_new_job_sid(R"({"sid": "1756172871.1181"})"), "1756172871.1181");
  EXPECT_THROW(parse_new_job_sid(R"({"messages": []})"), spldl::error);
  EXPECT_THROW(parse_new_job_sid(R"({"sid": ""})"), spldl::error);
  EXPECT_THROW(parse_new_job_sid("<html/>"), spldl::error);
}

TEST(client, normalize_search) { // NOLINT
  EXPECT_EQ(normalize_search("index=main"), "search index=main");
  EXPECT_EQ(normalize_search("search index=main"), "search index=main");
  EXPECT_EQ(normalize_search("  search index=main"), "  search index=main");
  EXPECT_EQ(normalize_search("| tstats count"), "| tstats count");
  EXPECT_EQ(normalize_search("  | makeresults"), "  | makeresults");
  EXPECT_EQ(normalize_search("searchindex=main"), "search searchindex=main");
}
