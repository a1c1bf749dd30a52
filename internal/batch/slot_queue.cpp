#include "slot_queue.hpp"

namespace warranty::batch {

SlotQueue::SlotQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

bool SlotQueue::Enqueue(SlotTask task) {
  {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [&] { return shutdown_ || queue_.size() < capacity_; });
    if (shutdown_) return false;
    queue_.push(std::move(task));
  }
  not_empty_.notify_one();
  return true;
}

std::optional<SlotTask> SlotQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  not_empty_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  SlotTask task = std::move(queue_.front());
  queue_.pop();
  lock.unlock();
  not_full_.notify_one();
  return task;
}

void SlotQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    std::queue<SlotTask>().swap(queue_);
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

std::size_t SlotQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace warranty::batch
