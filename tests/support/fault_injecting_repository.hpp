#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace warranty::testing {

/*
  Repository that forwards to an inner one and fails chunk inserts on demand.

  FailChunkInserts(code, times) makes the next `times` InsertBarcodes calls
  return `code` without touching the inner store; times < 0 fails every call.
*/
class FaultInjectingRepository final : public db::Repository {
 public:
  explicit FaultInjectingRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  void FailChunkInserts(db::ErrorCode code, int times, std::string message = "injected fault") {
    std::lock_guard lock(mutex_);
    fault_code_    = code;
    faults_left_   = times;
    fault_message_ = std::move(message);
  }

  int ChunkInsertCalls() const {
    std::lock_guard lock(mutex_);
    return insert_calls_;
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_->Begin();
  }

  db::Result InsertBarcode(db::Transaction& tx, const db::model::BarcodeRecord& r) override {
    return inner_->InsertBarcode(tx, r);
  }

  db::Result InsertBarcodes(db::Transaction& tx, const std::vector<db::model::BarcodeRecord>& rows) override {
    {
      std::lock_guard lock(mutex_);
      ++insert_calls_;
      if (faults_left_ != 0) {
        if (faults_left_ > 0) --faults_left_;
        return db::Result::Err(fault_code_, fault_message_);
      }
    }
    return inner_->InsertBarcodes(tx, rows);
  }

  std::optional<db::model::BarcodeRecord> GetBarcode(db::Transaction& tx, const std::string& id) override {
    return inner_->GetBarcode(tx, id);
  }

  std::optional<db::model::BarcodeRecord> GetBarcodeByValue(db::Transaction& tx, const std::string& barcode) override {
    return inner_->GetBarcodeByValue(tx, barcode);
  }

  bool BarcodeExists(db::Transaction& tx, const std::string& barcode) override {
    return inner_->BarcodeExists(tx, barcode);
  }

  std::vector<db::model::BarcodeRecord> ListBarcodesByBatch(db::Transaction& tx, const std::string& batch_id,
                                                            const db::Pagination& page) override {
    return inner_->ListBarcodesByBatch(tx, batch_id, page);
  }

  std::vector<db::model::BarcodeRecord> ListBarcodesByProduct(db::Transaction& tx, const std::string& product_id,
                                                              const db::Pagination& page) override {
    return inner_->ListBarcodesByProduct(tx, product_id, page);
  }

  db::Result UpdateBarcode(db::Transaction& tx, const db::model::BarcodeRecord& r, model::BarcodeStatus expected_status) override {
    return inner_->UpdateBarcode(tx, r, expected_status);
  }

  db::Result InsertBarcodeEvent(db::Transaction& tx, const db::model::BarcodeEventRecord& r) override {
    return inner_->InsertBarcodeEvent(tx, r);
  }

  std::vector<db::model::BarcodeEventRecord> ListBarcodeEvents(db::Transaction& tx, const std::string& barcode_id) override {
    return inner_->ListBarcodeEvents(tx, barcode_id);
  }

  db::Result InsertBatch(db::Transaction& tx, const db::model::BatchRecord& r) override {
    return inner_->InsertBatch(tx, r);
  }

  std::optional<db::model::BatchRecord> GetBatch(db::Transaction& tx, const std::string& id) override {
    return inner_->GetBatch(tx, id);
  }

  db::Result UpdateBatch(db::Transaction& tx, const db::model::BatchRecord& r) override {
    return inner_->UpdateBatch(tx, r);
  }

  std::vector<db::model::BatchRecord> ListBatches(db::Transaction& tx, const db::BatchFilter& filter, const db::Pagination& page) override {
    return inner_->ListBatches(tx, filter, page);
  }

  db::Result InsertCollision(db::Transaction& tx, const db::model::CollisionRecord& r) override {
    return inner_->InsertCollision(tx, r);
  }

  std::vector<db::model::CollisionRecord> ListCollisions(db::Transaction& tx, const std::string& batch_id,
                                                         const db::Pagination& page) override {
    return inner_->ListCollisions(tx, batch_id, page);
  }

  db::Result NextSequence(db::Transaction& tx, const std::string& kind, int32_t year, uint64_t& value) override {
    return inner_->NextSequence(tx, kind, year, value);
  }

  db::Result InsertClaim(db::Transaction& tx, const db::model::ClaimRecord& r) override {
    return inner_->InsertClaim(tx, r);
  }

  std::optional<db::model::ClaimRecord> GetClaim(db::Transaction& tx, const std::string& id) override {
    return inner_->GetClaim(tx, id);
  }

  std::optional<db::model::ClaimRecord> GetClaimByNumber(db::Transaction& tx, const std::string& claim_number) override {
    return inner_->GetClaimByNumber(tx, claim_number);
  }

  db::Result UpdateClaim(db::Transaction& tx, const db::model::ClaimRecord& r, uint64_t expected_version) override {
    return inner_->UpdateClaim(tx, r, expected_version);
  }

  std::vector<db::model::ClaimRecord> ListClaims(db::Transaction& tx, const db::ClaimFilter& filter, const db::Pagination& page) override {
    return inner_->ListClaims(tx, filter, page);
  }

  std::vector<db::model::ClaimRecord> ListClaimsByBarcode(db::Transaction& tx, const std::string& barcode_id) override {
    return inner_->ListClaimsByBarcode(tx, barcode_id);
  }

  db::Result DeleteClaim(db::Transaction& tx, const std::string& id) override {
    return inner_->DeleteClaim(tx, id);
  }

  db::Result AppendTimelineEvent(db::Transaction& tx, db::model::TimelineEventRecord& event) override {
    return inner_->AppendTimelineEvent(tx, event);
  }

  std::vector<db::model::TimelineEventRecord> ListTimeline(db::Transaction& tx, const std::string& claim_id) override {
    return inner_->ListTimeline(tx, claim_id);
  }

  db::Result InsertTicket(db::Transaction& tx, const db::model::RepairTicketRecord& r) override {
    return inner_->InsertTicket(tx, r);
  }

  std::optional<db::model::RepairTicketRecord> GetTicket(db::Transaction& tx, const std::string& id) override {
    return inner_->GetTicket(tx, id);
  }

  db::Result UpdateTicket(db::Transaction& tx, const db::model::RepairTicketRecord& r) override {
    return inner_->UpdateTicket(tx, r);
  }

  std::vector<db::model::RepairTicketRecord> ListTickets(db::Transaction& tx, const db::TicketFilter& filter,
                                                         const db::Pagination& page) override {
    return inner_->ListTickets(tx, filter, page);
  }

  db::Result InsertAttachment(db::Transaction& tx, const db::model::AttachmentRecord& r) override {
    return inner_->InsertAttachment(tx, r);
  }

  std::optional<db::model::AttachmentRecord> GetAttachment(db::Transaction& tx, const std::string& id) override {
    return inner_->GetAttachment(tx, id);
  }

  db::Result UpdateAttachment(db::Transaction& tx, const db::model::AttachmentRecord& r) override {
    return inner_->UpdateAttachment(tx, r);
  }

  std::vector<db::model::AttachmentRecord> ListAttachments(db::Transaction& tx, const std::string& claim_id) override {
    return inner_->ListAttachments(tx, claim_id);
  }

  std::optional<db::model::IdempotencyRecord> GetIdempotencyKey(db::Transaction& tx, const std::string& scope,
                                                                const std::string& request_id) override {
    return inner_->GetIdempotencyKey(tx, scope, request_id);
  }

  db::Result PutIdempotencyKey(db::Transaction& tx, const db::model::IdempotencyRecord& r) override {
    return inner_->PutIdempotencyKey(tx, r);
  }

 private:
  std::shared_ptr<db::Repository> inner_;

  mutable std::mutex mutex_;
  db::ErrorCode      fault_code_  = db::ErrorCode::OK;
  int                faults_left_ = 0;
  std::string        fault_message_;
  int                insert_calls_ = 0;
};

} // namespace warranty::testing
