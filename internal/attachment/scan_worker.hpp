#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "scan_scheduler.hpp"

namespace warranty::core {
class AttachmentCustodian;
}

namespace warranty::attachment {

/*
  Background worker that runs queued scans through the configured
  scanner and records the verdict on the attachment.
*/
class ScanWorker {
 public:
  ScanWorker(std::shared_ptr<ScanScheduler> scheduler, warranty::core::AttachmentCustodian* custodian);
  ~ScanWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<ScanScheduler>       scheduler_;
  warranty::core::AttachmentCustodian* custodian_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace warranty::attachment
