#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace model_cache {

class ModelCache;

// Runs ModelCache::sweep_expired on a fixed interval from its own thread.
// The cache must outlive the sweeper.
class ExpirationSweeper {
public:
  // Uses the cache's configured sweep_interval.
  explicit ExpirationSweeper(ModelCache &cache);
  ExpirationSweeper(ModelCache &cache, std::chrono::milliseconds interval);
  ~ExpirationSweeper();

  ExpirationSweeper(const ExpirationSweeper &) = delete;
  ExpirationSweeper &operator=(const ExpirationSweeper &) = delete;

  void start();
  // Wakes the thread and joins it; safe to call twice.
  void stop();
  bool running() const { return running_.load(); }

  // One pass on the calling thread.
  std::size_t run_once();

  std::uint64_t runs() const { return runs_.load(); }
  std::uint64_t removed_total() const { return removed_total_.load(); }

private:
  void loop();

  ModelCache &cache_;
  std::chrono::milliseconds interval_;
  std::thread worker_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_requested_{false};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> runs_{0};
  std::atomic<std::uint64_t> removed_total_{0};
};

} // namespace model_cache
