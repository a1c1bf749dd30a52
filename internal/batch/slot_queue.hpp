#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "slot_task.hpp"

namespace warranty::batch {

/*
  Bounded blocking queue between the batch dispatcher and slot workers.

  Enqueue blocks while the queue is full; both ends return early once
  Shutdown() is called. Queued tasks are dropped on shutdown: their batch
  stays in_progress and is resumed from its committed count.
*/
class SlotQueue {
 public:
  explicit SlotQueue(std::size_t capacity);

  // false after shutdown
  bool Enqueue(SlotTask task);

  // blocking wait; nullopt after shutdown
  std::optional<SlotTask> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  std::size_t             capacity_;
  mutable std::mutex      mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::queue<SlotTask>    queue_;
  bool                    shutdown_ = false;
};

} // namespace warranty::batch
