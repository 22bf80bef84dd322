#include "utils/ticker.hpp"
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace docrep {
namespace utils {

Ticker::Ticker(std::string name, std::chrono::milliseconds interval, std::function<void()> task)
  : name_(std::move(name))
  , interval_(interval)
  , task_(std::move(task))
  , timer_(io_context_) {
  if (interval_.count() <= 0) {
    throw std::invalid_argument("Ticker: interval must be positive");
  }
}

Ticker::~Ticker() {
  stop();
}

void Ticker::start() {
  std::lock_guard<std::mutex> lock(control_mutex_);
  if (running_) {
    return;
  }
  running_ = true;

  io_context_.restart();
  work_.emplace(boost::asio::make_work_guard(io_context_));
  schedule();
  thread_ = std::thread([this]() { io_context_.run(); });

  BOOST_LOG_TRIVIAL(info) << "Ticker: " << name_ << " started, interval " << interval_.count() << " ms";
}

void Ticker::stop() {
  std::lock_guard<std::mutex> lock(control_mutex_);
  if (!running_) {
    return;
  }
  running_ = false;

  boost::asio::post(io_context_, [this]() { timer_.cancel(); });
  work_.reset();
  io_context_.stop();
  if (thread_.joinable()) {
    thread_.join();
  }

  BOOST_LOG_TRIVIAL(info) << "Ticker: " << name_ << " stopped after " << runs_ << " run(s)";
}

void Ticker::schedule() {
  timer_.expires_after(interval_);
  timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || !running_) {
      return;
    }
    try {
      task_();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Ticker: " << name_ << " run failed: " << e.what();
    }
    ++runs_;
    if (running_) {
      schedule();
    }
  });
}

} // namespace utils
} // namespace docrep
