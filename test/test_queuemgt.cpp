#include "dnl/queuemgt.hpp"
#include "dnl/shared.hpp"
#include "logger.hpp"
#include "spldl.hpp"
#include "gtest/gtest.h"
#include <algorithm>
#include <cstddef>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <numeric>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

std::string payload(std::size_t index) { return fmt::format("<page {}>\n", index); }

std::string in_order(std::size_t n) {
  std::string out;
  for (std::size_t i = 0; i != n; ++i) out += payload(i);
  return out;
}

class CollectorTest : public testing::Test {
protected:
  std::string collect(const std::vector<std::size_t>& arrival, std::size_t total,
                      spldl::dnl::collect_result* result = nullptr) {
    std::string                  out;
    spldl::dnl::ordered_collector collector(
        total, [&](const std::string& p) { out += p; }, logger);
    for (auto i: arrival) collector.accept(spldl::page{i, payload(i)});
    if (result != nullptr) *result = collector.result();
    return out;
  }

  std::stringstream    log;
  spldl::thread_logger logger{log, true};
};

} // namespace

TEST_F(CollectorTest, in_order_arrival) { // NOLINT
  EXPECT_EQ(collect({0, 1, 2, 3}, 4), in_order(4));
}

TEST_F(CollectorTest, reverse_arrival) { // NOLINT
  spldl::dnl::collect_result res;
  EXPECT_EQ(collect({4, 3, 2, 1, 0}, 5, &res), in_order(5));
  EXPECT_EQ(res.next_index, 5U);
  EXPECT_EQ(res.pages_written, 5U);
  EXPECT_EQ(res.bytes_written, in_order(5).size());
  EXPECT_TRUE(res.held.empty());
}

TEST_F(CollectorTest, every_permutation_of_six) { // NOLINT
  std::vector<std::size_t> arrival(6);
  std::iota(arrival.begin(), arrival.end(), 0);
  const auto expected = in_order(6);
  do {
    EXPECT_EQ(collect(arrival, 6), expected) << fmt::format("{}", fmt::join(arrival, ","));
  } while (std::next_permutation(arrival.begin(), arrival.end()));
}

TEST_F(CollectorTest, random_shuffles_of_many_pages) { // NOLINT
  logger.set_debug(false);
  std::mt19937_64          generator{std::random_device{}()};
  std::vector<std::size_t> arrival(500);
  std::iota(arrival.begin(), arrival.end(), 0);
  const auto expected = in_order(arrival.size());
  for (int round = 0; round != 20; ++round) {
    std::shuffle(arrival.begin(), arrival.end(), generator);
    EXPECT_EQ(collect(arrival, arrival.size()), expected);
  }
}

TEST_F(CollectorTest, gap_stops_output_and_holds_later_pages) { // NOLINT
  spldl::dnl::collect_result res;
  // page 2 never arrives
  auto out = collect({3, 0, 5, 1, 4}, 6, &res);
  EXPECT_EQ(out, payload(0) + payload(1));
  EXPECT_EQ(res.next_index, 2U);
  EXPECT_EQ(res.pages_written, 2U);
  EXPECT_EQ(res.held, (std::vector<std::size_t>{3, 4, 5}));
}

TEST_F(CollectorTest, duplicate_page_written_once) { // NOLINT
  EXPECT_EQ(collect({0, 0, 1}, 2), in_order(2));
  EXPECT_NE(log.str().find("received twice"), std::string::npos);
}

TEST_F(CollectorTest, empty_payloads_still_advance) { // NOLINT
  std::string                   out;
  spldl::dnl::ordered_collector collector(
      3, [&](const std::string& p) { out += p; }, logger);
  collector.accept({2, ""});
  collector.accept({0, "a"});
  EXPECT_EQ(collector.next_index(), 1U);
  EXPECT_EQ(collector.held_size(), 1U);
  collector.accept({1, "b"});
  EXPECT_EQ(collector.next_index(), 3U);
  EXPECT_EQ(out, "ab");
}

TEST_F(CollectorTest, run_consumes_queue_until_closed) { // NOLINT
  spldl::dnl::page_queue_t pages(4);
  std::string              out;

  std::vector<std::size_t> arrival(50);
  std::iota(arrival.begin(), arrival.end(), 0);
  std::shuffle(arrival.begin(), arrival.end(), std::mt19937_64{42});

  std::jthread producer([&] {
    for (auto i: arrival) pages.push(spldl::page{i, payload(i)});
    pages.close();
  });

  spldl::dnl::ordered_collector collector(
      arrival.size(), [&](const std::string& p) { out += p; }, logger);
  auto res = collector.run(pages);
  producer.join();

  EXPECT_EQ(out, in_order(arrival.size()));
  EXPECT_EQ(res.next_index, arrival.size());
}

TEST_F(CollectorTest, progress_meter) { // NOLINT
  spldl::dnl::page_queue_t pages(4);
  pages.push(spldl::page{1, "b"});
  pages.push(spldl::page{0, "a"});
  pages.close();

  std::stringstream             progress;
  std::string                   out;
  spldl::dnl::ordered_collector collector(
      2, [&](const std::string& p) { out += p; }, logger, &progress);
  collector.run(pages);

  EXPECT_EQ(out, "ab");
  EXPECT_NE(progress.str().find("Progress: 2 / 2 pages"), std::string::npos) << progress.str();
}

TEST_F(CollectorTest, write_failure_propagates) { // NOLINT
  spldl::dnl::ordered_collector collector(
      2, [](const std::string&) { throw std::runtime_error("disk full"); }, logger);
  EXPECT_THROW(collector.accept({0, "a"}), std::runtime_error);
}
