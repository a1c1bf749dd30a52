#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "slot_queue.hpp"

namespace warranty::core {
class BatchEngine;
}

namespace warranty::batch {

/*
  Slot worker.

  Pulls slots off the shared queue and hands each to the engine, which
  generates, checks and stages one barcode per slot.
*/
class BatchWorker {
 public:
  BatchWorker(std::shared_ptr<SlotQueue> queue, warranty::core::BatchEngine* engine);
  ~BatchWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<SlotQueue>   queue_;
  warranty::core::BatchEngine* engine_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace warranty::batch
