#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/attachment_record.hpp"
#include "internal/db/model/barcode_record.hpp"
#include "internal/db/model/batch_record.hpp"
#include "internal/db/model/claim_record.hpp"
#include "internal/db/model/repair_ticket_record.hpp"

namespace warranty::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - Writes return Result; data errors are never thrown
  - Reads throw db::DbError only when the backend itself fails
  - Unique barcode collisions surface as ErrorCode::AlreadyExists
  - Compare-and-set updates that lose return ErrorCode::Conflict

  The DB is the source of truth for:
    barcode lifecycle
    batch progress
    claim / ticket state
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Barcodes
  // ---------------------------------------------------------------------

  virtual Result InsertBarcode(Transaction&, const model::BarcodeRecord&) = 0;

  // All-or-nothing over the chunk.
  virtual Result InsertBarcodes(Transaction&, const std::vector<model::BarcodeRecord>&) = 0;

  virtual std::optional<model::BarcodeRecord> GetBarcode(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::BarcodeRecord> GetBarcodeByValue(Transaction&, const std::string& barcode) = 0;

  virtual bool BarcodeExists(Transaction&, const std::string& barcode) = 0;

  virtual std::vector<model::BarcodeRecord> ListBarcodesByBatch(Transaction&, const std::string& batch_id, const Pagination&) = 0;

  virtual std::vector<model::BarcodeRecord> ListBarcodesByProduct(Transaction&, const std::string& product_id, const Pagination&) = 0;

  // Applies only when the stored status equals expected_status.
  virtual Result UpdateBarcode(Transaction&, const model::BarcodeRecord&, model::BarcodeStatus expected_status) = 0;

  virtual Result InsertBarcodeEvent(Transaction&, const model::BarcodeEventRecord&) = 0;

  virtual std::vector<model::BarcodeEventRecord> ListBarcodeEvents(Transaction&, const std::string& barcode_id) = 0;

  // ---------------------------------------------------------------------
  // Batches
  // ---------------------------------------------------------------------

  virtual Result InsertBatch(Transaction&, const model::BatchRecord&) = 0;

  virtual std::optional<model::BatchRecord> GetBatch(Transaction&, const std::string& id) = 0;

  virtual Result UpdateBatch(Transaction&, const model::BatchRecord&) = 0;

  virtual std::vector<model::BatchRecord> ListBatches(Transaction&, const BatchFilter&, const Pagination&) = 0;

  virtual Result InsertCollision(Transaction&, const model::CollisionRecord&) = 0;

  virtual std::vector<model::CollisionRecord> ListCollisions(Transaction&, const std::string& batch_id, const Pagination&) = 0;

  // ---------------------------------------------------------------------
  // Human-readable number sequences (BATCH- / WAR- / RPR-)
  // ---------------------------------------------------------------------

  virtual Result NextSequence(Transaction&, const std::string& kind, int32_t year, uint64_t& value) = 0;

  // ---------------------------------------------------------------------
  // Claims
  // ---------------------------------------------------------------------

  virtual Result InsertClaim(Transaction&, const model::ClaimRecord&) = 0;

  virtual std::optional<model::ClaimRecord> GetClaim(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::ClaimRecord> GetClaimByNumber(Transaction&, const std::string& claim_number) = 0;

  // record.version must already be expected_version + 1.
  virtual Result UpdateClaim(Transaction&, const model::ClaimRecord&, uint64_t expected_version) = 0;

  virtual std::vector<model::ClaimRecord> ListClaims(Transaction&, const ClaimFilter&, const Pagination&) = 0;

  virtual std::vector<model::ClaimRecord> ListClaimsByBarcode(Transaction&, const std::string& barcode_id) = 0;

  // Cascades to timeline, attachments and tickets.
  virtual Result DeleteClaim(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Claim timeline (append-only)
  // ---------------------------------------------------------------------

  // Assigns event.sequence.
  virtual Result AppendTimelineEvent(Transaction&, model::TimelineEventRecord& event) = 0;

  virtual std::vector<model::TimelineEventRecord> ListTimeline(Transaction&, const std::string& claim_id) = 0;

  // ---------------------------------------------------------------------
  // Repair tickets
  // ---------------------------------------------------------------------

  virtual Result InsertTicket(Transaction&, const model::RepairTicketRecord&) = 0;

  virtual std::optional<model::RepairTicketRecord> GetTicket(Transaction&, const std::string& id) = 0;

  virtual Result UpdateTicket(Transaction&, const model::RepairTicketRecord&) = 0;

  virtual std::vector<model::RepairTicketRecord> ListTickets(Transaction&, const TicketFilter&, const Pagination&) = 0;

  // ---------------------------------------------------------------------
  // Attachments
  // ---------------------------------------------------------------------

  virtual Result InsertAttachment(Transaction&, const model::AttachmentRecord&) = 0;

  virtual std::optional<model::AttachmentRecord> GetAttachment(Transaction&, const std::string& id) = 0;

  virtual Result UpdateAttachment(Transaction&, const model::AttachmentRecord&) = 0;

  virtual std::vector<model::AttachmentRecord> ListAttachments(Transaction&, const std::string& claim_id) = 0;

  // ---------------------------------------------------------------------
  // Idempotency keys
  // ---------------------------------------------------------------------

  virtual std::optional<model::IdempotencyRecord> GetIdempotencyKey(Transaction&, const std::string& scope, const std::string& request_id) = 0;

  virtual Result PutIdempotencyKey(Transaction&, const model::IdempotencyRecord&) = 0;
};

} // namespace warranty::db
