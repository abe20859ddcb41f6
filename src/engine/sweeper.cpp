#include "model_cache/sweeper.hpp"
#include "model_cache/log.hpp"
#include "model_cache/model_cache.hpp"

#include <exception>

namespace model_cache {

ExpirationSweeper::ExpirationSweeper(ModelCache &cache)
    : ExpirationSweeper(cache, cache.config().sweep_interval) {}

ExpirationSweeper::ExpirationSweeper(ModelCache &cache,
                                     std::chrono::milliseconds interval)
    : cache_(cache), interval_(interval) {}

ExpirationSweeper::~ExpirationSweeper() { stop(); }

void ExpirationSweeper::start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (worker_.joinable())
    return;
  stop_requested_ = false;
  running_ = true;
  worker_ = std::thread(&ExpirationSweeper::loop, this);
  logger()->info("expiration sweeper started (interval {} ms)",
                 interval_.count());
}

void ExpirationSweeper::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!worker_.joinable())
      return;
    stop_requested_ = true;
  }
  cv_.notify_all();
  worker_.join();
  running_ = false;
  logger()->info("expiration sweeper stopped after {} runs", runs_.load());
}

std::size_t ExpirationSweeper::run_once() {
  const auto removed = cache_.sweep_expired();
  ++runs_;
  removed_total_ += removed;
  return removed;
}

void ExpirationSweeper::loop() {
  std::unique_lock<std::mutex> lock(mu_);
  while (!stop_requested_) {
    if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; }))
      break;
    lock.unlock();
    try {
      run_once();
    } catch (const std::exception &e) {
      // A failed pass must not take the process down; retry next interval.
      logger()->error("expiration sweep failed: {}", e.what());
    }
    lock.lock();
  }
}

} // namespace model_cache
