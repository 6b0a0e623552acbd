#include "client/splunk_client.hpp"
#include "dnl/download.hpp"
#include "dnl/shared.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "spldl.hpp"
#include <CLI/CLI.hpp>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fmt/format.h>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

struct cli_config_t {
  std::string   output_filename;
  std::string   search;
  std::string   sid;
  std::string   earliest = "-24h";
  std::string   latest   = "now";
  std::string   host;
  std::uint16_t port = 8089;
  std::string   token;
  std::string   username;
  std::string   password;
  std::string   format;
  std::size_t   max_connections  = 8;
  bool          insecure         = false;
  bool          no_tls           = false;
  bool          delete_when_done = false;
  bool          force            = false;
  bool          verbose          = false;
  bool          progress         = true;
};

void define_options(CLI::App& app, cli_config_t& cli) {

  app.add_option("output_filename", cli.output_filename,
                 "The file the results are written to. The extension (.ndjson, .csv or .txt) "
                 "selects the output format unless --format is given.")
      ->required();

  auto* search = app.add_option("--search", cli.search,
                                "A search to run. It is submitted as a new job, and downloaded "
                                "once complete.");
  auto* sid    = app.add_option("--sid", cli.sid, "An already completed search id to download.");
  search->excludes(sid);

  app.add_option("--earliest", cli.earliest,
                 fmt::format("Earliest time for --search (default: {})", cli.earliest));
  app.add_option("--latest", cli.latest,
                 fmt::format("Latest time for --search (default: {})", cli.latest));

  app.add_option("--host", cli.host, "The splunk host.")->required();
  app.add_option("--port", cli.port,
                 fmt::format("The splunk management port (default: {})", cli.port));

  app.add_option("--token", cli.token, "Splunk bearer token.")->envname("SPLUNK_TOKEN");
  app.add_option("--username", cli.username, "Splunk username.")->envname("SPLUNK_USERNAME");
  app.add_option("--password", cli.password, "Splunk password.")->envname("SPLUNK_PASSWORD");

  app.add_flag("-k,--insecure", cli.insecure, "Don't verify the server's TLS certificate.");
  app.add_flag("--no-tls", cli.no_tls, "Talk plain http to the server.");

  app.add_flag("-d,--delete-when-done", cli.delete_when_done,
               "Delete the job once its results are downloaded. Off by default.");

  app.add_option("--max-connections", cli.max_connections,
                 fmt::format("The maximum number of concurrent downloads (default: {})",
                             cli.max_connections))
      ->check(CLI::PositiveNumber);

  app.add_option("--format", cli.format,
                 "Output format, overrides the output file extension.")
      ->check(CLI::IsMember({"raw", "csv", "ndjson"}));

  app.add_flag("--force", cli.force, "Overwrite any existing output file!");

  app.add_flag("-v,--verbose", cli.verbose,
               "Send verbose thread debug output to stderr. Turns off progress.");
  app.add_flag("--progress,!--no-progress", cli.progress,
               "Show a progress meter on stderr. This is the default.");
}

spldl::client::auth_config make_auth(const cli_config_t& cli) {
  spldl::client::auth_config auth;
  if (!cli.token.empty()) {
    auth.type  = spldl::client::auth_type::token;
    auth.token = cli.token;
  } else if (!cli.username.empty() && !cli.password.empty()) {
    auth.type     = spldl::client::auth_type::http_basic;
    auth.username = cli.username;
    auth.password = cli.password;
  } else {
    throw std::runtime_error("No authentication method provided. Use --token (or SPLUNK_TOKEN), "
                             "or --username and --password.");
  }
  return auth;
}

void check_options(const cli_config_t& cli) {
  if (cli.search.empty() && cli.sid.empty()) {
    throw std::runtime_error("You must provide either --search or --sid.");
  }

  if (!cli.force && std::filesystem::exists(cli.output_filename)) {
    throw std::runtime_error(fmt::format("File '{}' exists. Use `--force` to overwrite.",
                                         cli.output_filename));
  }
}

spldl::dnl::job_api make_job_api(const spldl::client::splunk_client& client) {
  return {
      [&client](const std::string& sid) { return client.get_job_status(sid); },
      [&client](const std::string& sid, std::size_t count, std::size_t page_index,
                spldl::output_format format) {
        return client.get_job_results(sid, count, page_index, format);
      },
      [&client](const std::string& sid) { client.delete_search_job(sid); },
  };
}

void launch(const cli_config_t& cli, const spldl::thread_logger& logger) {
  spldl::client::client_config client_cfg;
  client_cfg.host       = cli.host;
  client_cfg.port       = cli.port;
  client_cfg.auth       = make_auth(cli);
  client_cfg.use_tls    = !cli.no_tls;
  client_cfg.verify_tls = !cli.insecure;

  spldl::dnl::config_t cfg;
  cfg.output_filename  = cli.output_filename;
  cfg.format           = cli.format.empty() ? spldl::format_from_filename(cli.output_filename)
                                            : spldl::parse_output_format(cli.format);
  cfg.concurrency      = cli.max_connections;
  cfg.delete_when_done = cli.delete_when_done;
  cfg.progress         = cli.progress;
  cfg.sid              = cli.sid;

  const spldl::client::splunk_client client(client_cfg, logger);

  if (cfg.sid.empty()) {
    cfg.sid = client.new_search_job(cli.search, cli.earliest, cli.latest);
    logger.info(fmt::format("Created search job {}", cfg.sid));
    logger.info("Waiting for job to be done");
    client.wait_until_job_is_done(cfg.sid);
  }

  logger.info(fmt::format("Downloading search results for {}", cfg.sid));

  auto report = spldl::dnl::download_to_file(cfg, make_job_api(client), logger, {}, &std::cerr);
  if (report.cleanup_failure) {
    std::cerr << fmt::format("Warning: {}\n", report.cleanup_failure->what());
  }
  logger.info(fmt::format("Downloaded search results to {}", cfg.output_filename));
}

} // namespace

int main(int argc, char* argv[]) {
  cli_config_t cli;

  CLI::App app("Download splunk search results");
  define_options(app, cli);
  CLI11_PARSE(app, argc, argv);

  if (cli.verbose) cli.progress = false;

  const spldl::thread_logger logger(std::cerr, cli.verbose);
  logger.name_thread("main");

  try {
    check_options(cli);
    spldl::client::init_curl();
    try {
      launch(cli, logger);
    } catch (...) {
      spldl::client::shutdown_curl();
      throw;
    }
    spldl::client::shutdown_curl();
  } catch (const std::exception& e) {
    std::cerr << fmt::format("Error: {}\n", e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
