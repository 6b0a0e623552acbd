#include "client/splunk_client.hpp"
#include "client/decode.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "spldl.hpp"
#include <chrono>
#include <cstddef>
#include <curl/curl.h>
#include <fmt/format.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <regex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace spldl::client {

using json = nlohmann::json;

void init_curl() {
  if (curl_global_init(CURL_GLOBAL_ALL) != 0) {
    throw error("Error: Could not init curl");
  }
}

void shutdown_curl() { curl_global_cleanup(); }

std::string make_base_url(const client_config& config) {
  return fmt::format("{}://{}:{}", config.use_tls ? "https" : "http", config.host, config.port);
}

std::string encode_query(const query_params_t& params) {
  auto escape = [](const std::string& s) {
    // the handle argument is unused by curl_easy_escape
    std::unique_ptr<char, decltype(&curl_free)> escaped(
        curl_easy_escape(nullptr, s.c_str(), static_cast<int>(s.length())), curl_free);
    if (!escaped) throw error(fmt::format("encode_query: could not escape '{}'", s));
    return std::string(escaped.get());
  };

  std::string query;
  for (const auto& [key, value]: params) {
    if (!query.empty()) query += '&';
    query += escape(key) + '=' + escape(value);
  }
  return query;
}

job_status parse_job_status(const std::string& body, const std::string& sid) {
  json entries;
  try {
    auto doc = json::parse(body);
    if (doc.is_object()) entries = doc.value("entry", json::array());
  } catch (const json::exception& e) {
    throw error(fmt::format("error unmarshalling job status: {}", e.what()));
  }

  if (!entries.is_array() || entries.empty()) {
    throw error(fmt::format("no job found for sid {}", sid));
  }

  job_status status;
  try {
    const auto& content          = entries[0].at("content");
    status.sid                   = content.value("sid", sid);
    status.result_count          = content.value("resultCount", std::size_t{0});
    status.is_done               = content.value("isDone", false);
    status.is_failed             = content.value("isFailed", false);
    status.dispatch_state        = content.value("dispatchState", std::string{});
    status.done_progress         = content.value("doneProgress", 0.0);
    status.event_count           = content.value("eventCount", std::size_t{0});
    status.event_available_count = content.value("eventAvailableCount", std::size_t{0});
    status.run_duration          = content.value("runDuration", 0.0);
  } catch (const json::exception& e) {
    throw error(fmt::format("error unmarshalling job status for sid {}: {}", sid, e.what()));
  }
  return status;
}

std::string parse_new_job_sid(const std::string& body) {
  try {
    auto doc = json::parse(body);
    auto sid = doc.at("sid").get<std::string>();
    if (sid.empty()) throw error("new search job response contained an empty sid");
    return sid;
  } catch (const json::exception& e) {
    throw error(fmt::format("error unmarshalling new search job: {}", e.what()));
  }
}

std::string normalize_search(const std::string& search) {
  static const std::regex generating(R"(^\s*(\||search ))");
  if (std::regex_search(search, generating)) {
    return search;
  }
  return "search " + search;
}

splunk_client::splunk_client(client_config config, const thread_logger& logger)
    : config_(std::move(config)), base_url_(make_base_url(config_)), logger_(logger) {}

std::string splunk_client::perform(const std::string& method, const std::string& url,
                                   const std::string* content_type,
                                   const std::string* body) const {
  logger_.debug(fmt::format("Making HTTP request: {} {}", method, url));

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
  if (!curl) throw http_error("curl_easy_init failed");

  CURL* easy = curl.get();
  curl_easy_setopt(easy, CURLOPT_URL, url.c_str());
  curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L); // many threads
  // abort if slower than 1000 bytes/sec during 30 seconds
  curl_easy_setopt(easy, CURLOPT_LOW_SPEED_TIME, 30L);
  curl_easy_setopt(easy, CURLOPT_LOW_SPEED_LIMIT, 1000L);

  if (config_.use_tls && !config_.verify_tls) {
    curl_easy_setopt(easy, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(easy, CURLOPT_SSL_VERIFYHOST, 0L);
  }

  if (method == "POST") {
    curl_easy_setopt(easy, CURLOPT_POST, 1L);
    curl_easy_setopt(easy, CURLOPT_POSTFIELDS, body != nullptr ? body->c_str() : "");
    curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE,
                     body != nullptr ? static_cast<long>(body->length()) : 0L);
  } else if (method != "GET") {
    curl_easy_setopt(easy, CURLOPT_CUSTOMREQUEST, method.c_str());
  }

  curl_slist* raw_headers = nullptr;
  std::string auth_header;
  switch (config_.auth.type) {
  case auth_type::http_basic:
    curl_easy_setopt(easy, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(easy, CURLOPT_USERNAME, config_.auth.username.c_str());
    curl_easy_setopt(easy, CURLOPT_PASSWORD, config_.auth.password.c_str());
    break;
  case auth_type::token:
    auth_header = "Authorization: Bearer " + config_.auth.token;
    raw_headers = curl_slist_append(raw_headers, auth_header.c_str());
    break;
  }
  std::string content_type_header;
  if (content_type != nullptr) {
    content_type_header = "Content-Type: " + *content_type;
    raw_headers         = curl_slist_append(raw_headers, content_type_header.c_str());
  }
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(raw_headers,
                                                                      curl_slist_free_all);
  if (headers) curl_easy_setopt(easy, CURLOPT_HTTPHEADER, headers.get());

  // can't put inline as setopt is a macro which fails
  auto write_cb = [](char* ptr, size_t size, size_t nmemb, void* result) {
    *static_cast<std::string*>(result) += std::string_view{ptr, size * nmemb};
    return size * nmemb;
  };

  curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, +write_cb); // convert to func ptr
  std::string result_body;
  curl_easy_setopt(easy, CURLOPT_WRITEDATA, &result_body);

  if (auto res = curl_easy_perform(easy); res != CURLE_OK) {
    logger_.debug(fmt::format("HTTP request failed: {} {}: {}", method, url,
                              curl_easy_strerror(res)));
    throw http_error(
        fmt::format("{} '{}' failed. Error: {}", method, url, curl_easy_strerror(res)));
  }

  long status = 0;
  curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &status);
  logger_.debug(fmt::format("HTTP response received: status {} size {} for {}", status,
                            result_body.size(), url));

  if (status >= 400) {
    throw http_error(fmt::format("HTTP {}: {} '{}'", status, method, url), status);
  }
  return result_body;
}

std::string splunk_client::get(const std::string& path, const query_params_t& params) const {
  return perform("GET", base_url_ + path + "?" + encode_query(params), nullptr, nullptr);
}

std::string splunk_client::post(const std::string& path, const std::string& content_type,
                                const query_params_t& params, const std::string& body) const {
  return perform("POST", base_url_ + path + "?" + encode_query(params), &content_type, &body);
}

std::string splunk_client::del(const std::string& path, const query_params_t& params) const {
  return perform("DELETE", base_url_ + path + "?" + encode_query(params), nullptr, nullptr);
}

job_status splunk_client::get_job_status(const std::string& sid) const {
  auto body = get(fmt::format("/services/search/v2/jobs/{}", sid), {{"output_mode", "json"}});
  return parse_job_status(body, sid);
}

std::string splunk_client::get_job_results(const std::string& sid, std::size_t count,
                                           std::size_t page_index, output_format format) const {
  auto response = get(fmt::format("/services/search/v2/jobs/{}/results", sid),
                      {
                          {"count", std::to_string(count)},
                          {"offset", std::to_string(page_index * count)},
                          {"output_mode", output_mode_param(format)},
                      });

  auto decoded = decode_page(format, response, page_index);
  logger_.debug(fmt::format("Job results page processed: sid {} page {} response_size {} "
                            "parsed_size {}",
                            sid, page_index, response.size(), decoded.size()));
  return decoded;
}

std::string splunk_client::new_search_job(const std::string& search, const std::string& earliest,
                                          const std::string& latest) const {
  auto full_search = normalize_search(search);
  if (full_search != search) {
    logger_.debug(fmt::format("Prepended 'search ' to search string: {}", full_search));
  }
  logger_.debug(fmt::format("Creating new search job: search='{}' earliest='{}' latest='{}'",
                            full_search, earliest, latest));

  auto body = encode_query({
      {"search", full_search},
      {"earliest_time", earliest},
      {"latest_time", latest},
      {"rf", "*"},
      {"timeout", "3600"},
  });

  auto response = post("/services/search/jobs", "application/x-www-form-urlencoded",
                       {{"output_mode", "json"}}, body);
  auto sid      = parse_new_job_sid(response);
  logger_.debug(fmt::format("Search job created successfully: sid {}", sid));
  return sid;
}

void splunk_client::wait_until_job_is_done(const std::string& sid, std::stop_token stoken,
                                           std::chrono::milliseconds interval) const {
  logger_.debug(fmt::format("Waiting for job {} to complete", sid));
  while (true) {
    auto status = get_job_status(sid);
    logger_.debug(fmt::format("Job status check: sid {} is_done {} dispatch_state {} "
                              "done_progress {:.1f}%",
                              sid, status.is_done, status.dispatch_state,
                              status.done_progress * 100));
    if (status.is_done) {
      logger_.debug(fmt::format("Job {} completed", sid));
      return;
    }
    if (status.is_failed) {
      throw job_failed(fmt::format("job {} has failed", sid));
    }

    // sleep in short steps so a stop request is noticed promptly
    auto deadline = std::chrono::steady_clock::now() + interval;
    while (std::chrono::steady_clock::now() < deadline) {
      if (stoken.stop_requested()) {
        throw cancelled(fmt::format("stopped waiting for job {}", sid));
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  }
}

void splunk_client::delete_search_job(const std::string& sid) const {
  del(fmt::format("/services/search/v2/jobs/{}", sid), {{"output_mode", "json"}});
}

} // namespace spldl::client
