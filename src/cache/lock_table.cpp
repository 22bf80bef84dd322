#include "cache/lock_table.hpp"
#include "common/errors.hpp"
#include <boost/log/trivial.hpp>

namespace docrep {
namespace cache {

TransferLockTable::Acquisition TransferLockTable::try_acquire(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  Acquisition acquisition;

  auto it = locks_.find(key);
  if (it != locks_.end()) {
    acquisition.acquired = false;
    acquisition.completion = it->second->completion;
    BOOST_LOG_TRIVIAL(debug) << "Transfer lock: " << key << " already held, waiting";
    return acquisition;
  }

  auto entry = std::make_unique<TransferLock>();
  entry->completion = entry->promise.get_future().share();
  entry->acquired_at = std::chrono::steady_clock::now();
  acquisition.acquired = true;
  acquisition.completion = entry->completion;
  locks_.emplace(key, std::move(entry));

  BOOST_LOG_TRIVIAL(debug) << "Transfer lock: Acquired " << key;
  return acquisition;
}

void TransferLockTable::release(const std::string& key, const std::string& result_path) {
  auto entry = take(key);
  if (!entry) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer lock: Release of unknown key " << key;
    return;
  }
  entry->promise.set_value(result_path);

  auto held = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - entry->acquired_at);
  BOOST_LOG_TRIVIAL(debug) << "Transfer lock: Released " << key << " after " << held.count() << " ms";
}

void TransferLockTable::fail(const std::string& key, std::exception_ptr error) {
  auto entry = take(key);
  if (!entry) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer lock: Failure reported for unknown key " << key;
    return;
  }
  entry->promise.set_exception(error);
  BOOST_LOG_TRIVIAL(debug) << "Transfer lock: Released " << key << " with error";
}

std::string TransferLockTable::wait(const std::shared_future<std::string>& completion,
                                    std::chrono::milliseconds timeout, const std::string& key) {
  if (completion.wait_for(timeout) != std::future_status::ready) {
    throw LockTimeoutError("waited " + std::to_string(timeout.count()) + " ms for " + key);
  }
  return completion.get();
}

bool TransferLockTable::is_locked(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return locks_.count(key) > 0;
}

std::size_t TransferLockTable::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return locks_.size();
}

std::unique_ptr<TransferLockTable::TransferLock> TransferLockTable::take(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = locks_.find(key);
  if (it == locks_.end()) {
    return nullptr;
  }
  auto entry = std::move(it->second);
  locks_.erase(it);
  return entry;
}

} // namespace cache
} // namespace docrep
