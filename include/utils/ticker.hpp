#ifndef DOCREP_UTILS_TICKER_HPP
#define DOCREP_UTILS_TICKER_HPP

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace docrep {
namespace utils {

// Runs a task periodically on its own thread. A run that throws is logged
// and the next run is still scheduled.
class Ticker {
public:
  Ticker(std::string name, std::chrono::milliseconds interval, std::function<void()> task);
  ~Ticker();

  Ticker(const Ticker&) = delete;
  Ticker& operator=(const Ticker&) = delete;

  void start();
  // Waits for a run in progress to finish
  void stop();
  bool running() const { return running_; }
  std::uint64_t runs() const { return runs_; }

private:
  using work_guard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  std::string name_;
  std::chrono::milliseconds interval_;
  std::function<void()> task_;

  boost::asio::io_context io_context_;
  boost::asio::steady_timer timer_;
  std::optional<work_guard> work_;
  std::thread thread_;
  std::mutex control_mutex_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> runs_{0};

  void schedule();
};

} // namespace utils
} // namespace docrep

#endif // DOCREP_UTILS_TICKER_HPP
