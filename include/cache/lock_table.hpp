#ifndef DOCREP_CACHE_LOCK_TABLE_HPP
#define DOCREP_CACHE_LOCK_TABLE_HPP

#include <chrono>
#include <exception>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace docrep {
namespace cache {

// Per-key exclusion for in-flight downloads. The first caller for a key owns
// the lock, later callers wait on its shared future.
class TransferLockTable {
public:
  struct Acquisition {
    bool acquired = false;
    // Resolves to the fetched path, or rethrows the owner's failure
    std::shared_future<std::string> completion;
  };

  // ---- LOCKING ----
  Acquisition try_acquire(const std::string& key);
  // Wakes waiters with the result path and drops the lock
  void release(const std::string& key, const std::string& result_path);
  // Wakes waiters with the owner's error and drops the lock
  void fail(const std::string& key, std::exception_ptr error);

  // ---- WAITING ----
  // Throws LockTimeoutError when timeout expires first
  static std::string wait(const std::shared_future<std::string>& completion,
                          std::chrono::milliseconds timeout, const std::string& key);

  // ---- QUERY ----
  bool is_locked(const std::string& key) const;
  std::size_t size() const;

private:
  struct TransferLock {
    std::promise<std::string> promise;
    std::shared_future<std::string> completion;
    std::chrono::steady_clock::time_point acquired_at;
  };

  mutable std::mutex mutex_;
  std::map<std::string, std::unique_ptr<TransferLock>> locks_;

  std::unique_ptr<TransferLock> take(const std::string& key);
};

} // namespace cache
} // namespace docrep

#endif // DOCREP_CACHE_LOCK_TABLE_HPP
