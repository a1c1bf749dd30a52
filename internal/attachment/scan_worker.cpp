#include "scan_worker.hpp"

#include "internal/core/attachment_custodian.hpp"
#include "internal/observability/logging.hpp"

namespace warranty::attachment {

ScanWorker::ScanWorker(std::shared_ptr<ScanScheduler> scheduler, warranty::core::AttachmentCustodian* custodian)
    : scheduler_(std::move(scheduler)), custodian_(custodian) {
}

ScanWorker::~ScanWorker() {
  Stop();
}

void ScanWorker::Start() {
  running_ = true;
  thread_  = std::thread(&ScanWorker::Run, this);
}

void ScanWorker::Stop() {
  scheduler_->Shutdown();
  if (thread_.joinable()) thread_.join();
  running_ = false;
}

void ScanWorker::Run() {
  while (running_) {
    auto task = scheduler_->Dequeue();
    if (!task) break;

    try {
      custodian_->RunScan(*task);
    } catch (const std::exception& e) {
      WARRANTY_LOG_WARN("attachment scan failed", {observability::StringField("attachment_id", task->attachment_id),
                                                    observability::StringField("error", e.what())});
    }
  }
}

} // namespace warranty::attachment
