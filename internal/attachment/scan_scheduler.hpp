#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "scan_task.hpp"

namespace warranty::attachment {

/*
  Thread-safe blocking queue for scan workers.

  Shutdown lets workers drain what is already queued.
*/
class ScanScheduler {
 public:
  void Enqueue(const ScanTask& task);

  // blocking wait
  std::optional<ScanTask> Dequeue();

  void Shutdown();

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<ScanTask>    queue_;
  bool                    shutdown_ = false;
};

} // namespace warranty::attachment
