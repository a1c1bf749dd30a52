#pragma once

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/sql_executor.hpp"

namespace warranty::db::sql {

/*
  Repository logic shared by the SQL backends.

  Backends supply Begin() and a way to reach the Executor behind a
  Transaction; every query, row mapping and compare-and-set rule lives
  here so SQLite and Postgres behave identically.
*/
class SqlRepository : public db::Repository {
 public:
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

 protected:
  virtual Executor& Exec(Transaction&) = 0;

 private:
  // Runs a SELECT and collects rows; throws DbError on backend failure.
  template <typename T, typename Mapper>
  std::vector<T> Select(Transaction& t, const std::string& sql, const Params& params, Mapper map);
};

} // namespace warranty::db::sql
