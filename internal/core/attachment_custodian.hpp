#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "attachment_rules.hpp"
#include "claim_workflow.hpp"
#include "collaborators.hpp"
#include "internal/attachment/scan_scheduler.hpp"
#include "internal/attachment/scan_worker.hpp"
#include "internal/db/api/repository.hpp"
#include "request_context.hpp"

namespace warranty::core {

struct UploadRequest : AttachmentUpload {
  std::string claim_id;
};

/*
  AttachmentCustodian

  Records attachment metadata against a claim and tracks its scan verdict.
  Uploads start as scan_status=pending. With an in-process scanner the
  scan runs on a background worker; otherwise an external scanner reports
  back through RecordScanResult. Customers only ever see passed files.
*/
class AttachmentCustodian {
 public:
  AttachmentCustodian(std::shared_ptr<db::Repository> repository, std::shared_ptr<ClaimWorkflow> claims, std::shared_ptr<AttachmentScanner> scanner,
                      std::shared_ptr<util::Clock> clock, AttachmentOptions options = {});
  ~AttachmentCustodian();

  // No-op without an in-process scanner.
  void StartScanWorkers(std::size_t count);
  void Shutdown();

  db::model::AttachmentRecord Upload(const RequestContext& ctx, const UploadRequest& request);

  // Queues scans for the claim's pending attachments, e.g. those filed
  // with the claim itself. No-op without an in-process scanner.
  void DispatchPendingScans(const std::string& claim_id);

  db::model::AttachmentRecord RecordScanResult(const RequestContext& ctx, const std::string& attachment_id, bool passed, const std::string& detail);

  std::vector<db::model::AttachmentRecord> List(const RequestContext& ctx, const std::string& claim_id);

  // Worker entry point.
  void RunScan(const attachment::ScanTask& task);

 private:
  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<ClaimWorkflow>     claims_;
  std::shared_ptr<AttachmentScanner> scanner_;
  std::shared_ptr<util::Clock>       clock_;
  AttachmentRules                    rules_;

  std::shared_ptr<attachment::ScanScheduler>            scheduler_;
  std::vector<std::unique_ptr<attachment::ScanWorker>> workers_;
};

} // namespace warranty::core
