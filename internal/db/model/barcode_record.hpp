#pragma once

#include <cstdint>
#include <string>

#include "internal/model/barcode.hpp"

namespace warranty::db::model {

using BarcodeStatus    = warranty::model::BarcodeStatus;
using BarcodeEventType = warranty::model::BarcodeEventType;

/*
  Persistent warranty barcode row.

  IMPORTANT:
  - barcode is globally unique (unique index); inserts that collide
    return ErrorCode::AlreadyExists.
  - activated_at_ms is 0 iff status == generated.
  - expiry_at_ms is written exactly once, at activation.
  - expired is never stored; it is projected on read from expiry_at_ms.
*/

struct BarcodeRecord {
  std::string id;
  std::string barcode;
  std::string product_id;
  std::string batch_id;  // empty when issued outside a batch
  std::string storefront_id;

  BarcodeStatus status = BarcodeStatus::kGenerated;

  int32_t warranty_period_months = 0;

  // Bound on activation
  std::string customer_id;
  std::string customer_email;
  uint64_t    activated_at_ms = 0;
  uint64_t    expiry_at_ms    = 0;

  // Purchase metadata supplied on activation
  std::string retailer;
  std::string invoice_number;
  std::string serial_number;
  uint64_t    purchase_date_ms     = 0;
  int64_t     purchase_price_cents = 0;

  std::string revoked_reason;
  std::string revoked_by;
  uint64_t    revoked_at_ms = 0;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

// Activation / revocation audit trail, separate from the claim timeline.
struct BarcodeEventRecord {
  std::string      id;
  std::string      barcode_id;
  BarcodeEventType event = BarcodeEventType::kStatusUpdated;
  std::string      actor_id;
  std::string      detail;
  uint64_t         at_ms = 0;
};

} // namespace warranty::db::model
