#pragma once

#include "spldl.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <stop_token>
#include <string>

namespace spldl {
class thread_logger;
}

namespace spldl::client {

enum class auth_type { http_basic, token };

struct auth_config {
  auth_type   type = auth_type::token;
  std::string username; // for http_basic
  std::string password; // for http_basic
  std::string token;    // for token
};

struct client_config {
  std::string   host;
  std::uint16_t port       = 8089;
  auth_config   auth;
  bool          use_tls    = true;
  bool          verify_tls = true; // ignored if use_tls is false
};

using query_params_t = std::map<std::string, std::string>;

void init_curl();
void shutdown_curl();

// talks to the splunk REST api. Each request uses its own curl easy handle, so one client
// may be shared by many threads.
class splunk_client {
public:
  splunk_client(client_config config, const thread_logger& logger);

  [[nodiscard]] const std::string& base_url() const { return base_url_; }

  std::string get(const std::string& path, const query_params_t& params) const;
  std::string post(const std::string& path, const std::string& content_type,
                   const query_params_t& params, const std::string& body) const;
  std::string del(const std::string& path, const query_params_t& params) const;

  job_status get_job_status(const std::string& sid) const;

  // one page of results, decoded for `format`. The offset sent is page_index * count.
  std::string get_job_results(const std::string& sid, std::size_t count, std::size_t page_index,
                              output_format format) const;

  std::string new_search_job(const std::string& search, const std::string& earliest,
                             const std::string& latest) const;

  void wait_until_job_is_done(const std::string& sid, std::stop_token stoken = {},
                              std::chrono::milliseconds interval = std::chrono::seconds(3)) const;

  void delete_search_job(const std::string& sid) const;

private:
  std::string perform(const std::string& method, const std::string& url,
                      const std::string* content_type, const std::string* body) const;

  client_config        config_;
  std::string          base_url_;
  const thread_logger& logger_; // NOLINT reference
};

// pure helpers, exposed for testing

std::string make_base_url(const client_config& config);
std::string encode_query(const query_params_t& params);
job_status  parse_job_status(const std::string& body, const std::string& sid);
std::string parse_new_job_sid(const std::string& body);
std::string normalize_search(const std::string& search);

} // namespace spldl::client
