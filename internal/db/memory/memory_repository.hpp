#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace warranty::db::memory {

class MemoryTransaction;

/*
  Copy-on-write table handle.

  A transaction snapshot copies only the handles; a table is cloned the
  first time the transaction writes to it.
*/
template <typename T>
class CowTable {
 public:
  CowTable() : data_(std::make_shared<T>()) {
  }

  const T& Get() const {
    return *data_;
  }

  T& Mut() {
    if (data_.use_count() > 1) data_ = std::make_shared<T>(*data_);
    return *data_;
  }

 private:
  std::shared_ptr<T> data_;
};

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertBarcode(Transaction&, const model::BarcodeRecord&) override;
  Result InsertBarcodes(Transaction&, const std::vector<model::BarcodeRecord>&) override;
  std::optional<model::BarcodeRecord> GetBarcode(Transaction&, const std::string&) override;
  std::optional<model::BarcodeRecord> GetBarcodeByValue(Transaction&, const std::string&) override;
  bool BarcodeExists(Transaction&, const std::string&) override;
  std::vector<model::BarcodeRecord> ListBarcodesByBatch(Transaction&, const std::string&, const Pagination&) override;
  std::vector<model::BarcodeRecord> ListBarcodesByProduct(Transaction&, const std::string&, const Pagination&) override;
  Result UpdateBarcode(Transaction&, const model::BarcodeRecord&, model::BarcodeStatus) override;
  Result InsertBarcodeEvent(Transaction&, const model::BarcodeEventRecord&) override;
  std::vector<model::BarcodeEventRecord> ListBarcodeEvents(Transaction&, const std::string&) override;

  Result InsertBatch(Transaction&, const model::BatchRecord&) override;
  std::optional<model::BatchRecord> GetBatch(Transaction&, const std::string&) override;
  Result UpdateBatch(Transaction&, const model::BatchRecord&) override;
  std::vector<model::BatchRecord> ListBatches(Transaction&, const BatchFilter&, const Pagination&) override;
  Result InsertCollision(Transaction&, const model::CollisionRecord&) override;
  std::vector<model::CollisionRecord> ListCollisions(Transaction&, const std::string&, const Pagination&) override;

  Result NextSequence(Transaction&, const std::string& kind, int32_t year, uint64_t& value) override;

  Result InsertClaim(Transaction&, const model::ClaimRecord&) override;
  std::optional<model::ClaimRecord> GetClaim(Transaction&, const std::string&) override;
  std::optional<model::ClaimRecord> GetClaimByNumber(Transaction&, const std::string&) override;
  Result UpdateClaim(Transaction&, const model::ClaimRecord&, uint64_t expected_version) override;
  std::vector<model::ClaimRecord> ListClaims(Transaction&, const ClaimFilter&, const Pagination&) override;
  std::vector<model::ClaimRecord> ListClaimsByBarcode(Transaction&, const std::string&) override;
  Result DeleteClaim(Transaction&, const std::string&) override;

  Result AppendTimelineEvent(Transaction&, model::TimelineEventRecord&) override;
  std::vector<model::TimelineEventRecord> ListTimeline(Transaction&, const std::string&) override;

  Result InsertTicket(Transaction&, const model::RepairTicketRecord&) override;
  std::optional<model::RepairTicketRecord> GetTicket(Transaction&, const std::string&) override;
  Result UpdateTicket(Transaction&, const model::RepairTicketRecord&) override;
  std::vector<model::RepairTicketRecord> ListTickets(Transaction&, const TicketFilter&, const Pagination&) override;

  Result InsertAttachment(Transaction&, const model::AttachmentRecord&) override;
  std::optional<model::AttachmentRecord> GetAttachment(Transaction&, const std::string&) override;
  Result UpdateAttachment(Transaction&, const model::AttachmentRecord&) override;
  std::vector<model::AttachmentRecord> ListAttachments(Transaction&, const std::string&) override;

  std::optional<model::IdempotencyRecord> GetIdempotencyKey(Transaction&, const std::string&, const std::string&) override;
  Result PutIdempotencyKey(Transaction&, const model::IdempotencyRecord&) override;

private:
  friend class MemoryTransaction;

  struct State {
    CowTable<std::unordered_map<std::string, model::BarcodeRecord>> barcodes;
    CowTable<std::unordered_map<std::string, std::string>>          barcode_index;  // barcode -> id
    CowTable<std::vector<model::BarcodeEventRecord>>                barcode_events;

    CowTable<std::unordered_map<std::string, model::BatchRecord>> batches;
    CowTable<std::vector<model::CollisionRecord>>                 collisions;
    CowTable<std::map<std::string, uint64_t>>                     sequences;

    CowTable<std::unordered_map<std::string, model::ClaimRecord>>                      claims;
    CowTable<std::unordered_map<std::string, std::vector<model::TimelineEventRecord>>> timelines;
    CowTable<std::unordered_map<std::string, model::RepairTicketRecord>>               tickets;
    CowTable<std::vector<model::AttachmentRecord>>                                     attachments;
    CowTable<std::map<std::string, model::IdempotencyRecord>>                          idempotency;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
