#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "collaborators.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "request_context.hpp"

namespace warranty::core {

inline constexpr std::string_view kQrPayloadBase = "https://warranty.smartseller.com/claim/";

// Read-time projection of a barcode row against the clock.
struct WarrantyDerived {
  warranty::model::BarcodeStatus effective_status = warranty::model::BarcodeStatus::kGenerated;
  bool                           is_expired       = false;
  int64_t                        days_remaining   = 0;
  bool                           can_claim        = false;
  std::string                    warranty_period;
  std::string                    qr_payload;
};

WarrantyDerived Derive(const db::model::BarcodeRecord& barcode, util::TimePoint now);

struct WarrantyView {
  db::model::BarcodeRecord barcode;
  WarrantyDerived          derived;
};

struct ActivationRequest {
  std::string            barcode;
  std::string            customer_id;
  std::string            customer_email;
  std::string            retailer;
  std::string            invoice_number;
  std::string            serial_number;
  uint64_t               purchase_date_ms = 0;
  std::optional<int64_t> purchase_price_cents;
};

/*
  WarrantyRegistry

  Owns the barcode lifecycle after issuance:

    generated --activate--> active --(replacement resolution)--> claimed
         \___________________\______--revoke--> revoked

  Every write is a compare-and-set on the stored status, so a second
  concurrent activation loses with util::Conflict. expired is never
  written; Derive() projects it from expiry_at_ms.
*/
class WarrantyRegistry {
 public:
  WarrantyRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<CustomerDirectory> customers, std::shared_ptr<util::Clock> clock);

  WarrantyView Activate(const RequestContext& ctx, const ActivationRequest& request);
  WarrantyView Revoke(const RequestContext& ctx, const std::string& barcode_ref, const std::string& reason);

  // barcode_ref is either the entity id or the barcode string.
  WarrantyView GetBarcode(const RequestContext& ctx, const std::string& barcode_ref);

  std::vector<db::model::BarcodeEventRecord> ListEvents(const RequestContext& ctx, const std::string& barcode_ref);

  // active -> claimed inside the caller's transaction.
  void MarkClaimed(db::Transaction& tx, const std::string& barcode_id, const std::string& actor_id, const std::string& detail);

  WarrantyView View(const db::model::BarcodeRecord& record) const;

 private:
  std::optional<db::model::BarcodeRecord> Find(db::Transaction& tx, const std::string& barcode_ref);
  void AppendEvent(db::Transaction& tx, const std::string& barcode_id, warranty::model::BarcodeEventType event, const std::string& actor_id,
                   const std::string& detail, uint64_t at_ms);

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<CustomerDirectory> customers_;
  std::shared_ptr<util::Clock>       clock_;
};

} // namespace warranty::core
