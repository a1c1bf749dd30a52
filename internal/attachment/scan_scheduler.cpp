#include "scan_scheduler.hpp"

namespace warranty::attachment {

void ScanScheduler::Enqueue(const ScanTask& task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    queue_.push(task);
  }
  cv_.notify_one();
}

std::optional<ScanTask> ScanScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  ScanTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void ScanScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace warranty::attachment
