#include <gtest/gtest.h>
#include <atomic>
#include <functional>
#include <stdexcept>
#include <thread>
#include "utils/ticker.hpp"
#include "test_utils.hpp"

using docrep::utils::Ticker;
using namespace std::chrono_literals;

namespace {

bool wait_until(const std::function<bool()>& condition, std::chrono::milliseconds limit = 2000ms) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return condition();
}

} // namespace

TEST(TickerTest, RunsRepeatedlyUntilStopped) {
  docrep::test::init_test_logging();
  std::atomic<int> calls{0};
  Ticker ticker("test", 10ms, [&calls]() { ++calls; });

  ticker.start();
  EXPECT_TRUE(ticker.running());
  EXPECT_TRUE(wait_until([&calls]() { return calls >= 3; }));

  ticker.stop();
  EXPECT_FALSE(ticker.running());
  int after_stop = calls;
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(calls, after_stop);
  EXPECT_GE(ticker.runs(), 3u);
}

TEST(TickerTest, ThrowingTaskKeepsTicking) {
  docrep::test::init_test_logging(boost::log::trivial::fatal);
  std::atomic<int> calls{0};
  Ticker ticker("failing", 10ms, [&calls]() {
    ++calls;
    throw std::runtime_error("boom");
  });

  ticker.start();
  EXPECT_TRUE(wait_until([&calls]() { return calls >= 2; }));
  ticker.stop();
}

TEST(TickerTest, RejectsNonPositiveInterval) {
  EXPECT_THROW(Ticker("bad", 0ms, []() {}), std::invalid_argument);
}

TEST(TickerTest, StopWithoutStartIsHarmless) {
  Ticker ticker("idle", 10ms, []() {});
  EXPECT_NO_THROW(ticker.stop());
  EXPECT_FALSE(ticker.running());
}
