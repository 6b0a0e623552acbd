#pragma once

#include <iostream>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <unordered_map>

namespace spldl {

// simple thread aware logging
// one instance is created by the caller and passed by reference to anything that logs

class thread_logger {
public:
  explicit thread_logger(std::ostream& os = std::cerr, bool debug = false)
      : os_(os), debug_(debug) {}

  void debug(const std::string& msg) const {
    if (debug_) write("DEBUG", msg);
  }
  void info(const std::string& msg) const { write("INFO", msg); }
  void warn(const std::string& msg) const { write("WARN", msg); }
  void error(const std::string& msg) const { write("ERROR", msg); }

  // label the calling thread in subsequent log lines
  void name_thread(const std::string& name) const;
  void name_thread(std::thread::id id, const std::string& name) const;
  std::string thread_name(std::thread::id id) const;

  [[nodiscard]] bool debug_enabled() const { return debug_; }
  void               set_debug(bool debug) { debug_ = debug; }

  // for callers that need to write raw text (eg the progress meter) without interleaving
  std::mutex& stream_mutex() const { return mutex_; }

private:
  void write(const char* level, const std::string& msg) const;

  std::ostream& os_; // NOLINT reference
  bool          debug_;

  mutable std::mutex                                       mutex_;
  mutable std::unordered_map<std::thread::id, std::string> thrnames_;
};

} // namespace spldl
