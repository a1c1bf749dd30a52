#include "batch_worker.hpp"

#include "internal/core/batch_engine.hpp"
#include "internal/observability/logging.hpp"

namespace warranty::batch {

BatchWorker::BatchWorker(std::shared_ptr<SlotQueue> queue, warranty::core::BatchEngine* engine) : queue_(std::move(queue)), engine_(engine) {
}

BatchWorker::~BatchWorker() {
  Stop();
}

void BatchWorker::Start() {
  running_ = true;
  thread_  = std::thread(&BatchWorker::Run, this);
}

void BatchWorker::Stop() {
  queue_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void BatchWorker::Run() {
  while (running_) {
    auto task = queue_->Dequeue();
    if (!task) break;

    try {
      engine_->ProcessSlot(*task);
    } catch (const std::exception& e) {
      WARRANTY_LOG_ERROR("batch slot failed", {observability::IntField("slot", task->slot), observability::StringField("error", e.what())});
    }
  }
}

} // namespace warranty::batch
