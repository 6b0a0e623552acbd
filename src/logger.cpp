#include "logger.hpp"
#include <chrono>
#include <fmt/chrono.h> // IWYU pragma: keep
#include <fmt/format.h>
#include <mutex>
#include <string>
#include <thread>

namespace spldl {

void thread_logger::name_thread(const std::string& name) const {
  name_thread(std::this_thread::get_id(), name);
}

void thread_logger::name_thread(std::thread::id id, const std::string& name) const {
  const std::lock_guard lk(mutex_);
  thrnames_[id] = name;
}

std::string thread_logger::thread_name(std::thread::id id) const {
  const std::lock_guard lk(mutex_);
  if (auto it = thrnames_.find(id); it != thrnames_.end()) return it->second;
  return "unnamed";
}

void thread_logger::write(const char* level, const std::string& msg) const {
  const std::lock_guard lk(mutex_);
  // can't portably use high resolution clock here
  auto        timestamp = std::chrono::system_clock::now();
  auto        it        = thrnames_.find(std::this_thread::get_id());
  const auto& thrname   = it != thrnames_.end() ? it->second : std::string{"unnamed"};
  os_ << fmt::format("{:%Y-%m-%d %H:%M:%S} {:<5} thread: {:>9}: {}\n",
                     std::chrono::floor<std::chrono::seconds>(timestamp), level, thrname, msg);
}

} // namespace spldl
