#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/claim.hpp"

namespace warranty::db::model {

using ClaimStatus       = warranty::model::ClaimStatus;
using Severity          = warranty::model::Severity;
using Priority          = warranty::model::Priority;
using IssueCategory     = warranty::model::IssueCategory;
using ResolutionType    = warranty::model::ResolutionType;
using TimelineEventType = warranty::model::TimelineEventType;
using ActorType         = warranty::model::ActorType;

/*
  Persistent warranty claim row.

  IMPORTANT:
  - version is the optimistic-concurrency token; UpdateClaim only applies
    when the stored version matches the caller's expected version.
  - total_cost_cents == repair + shipping + replacement after every write.
  - resolution_type / completed_at_ms are written once, on completion.
  - money is stored in integer cents.
*/

struct ClaimRecord {
  std::string id;
  std::string claim_number;
  std::string barcode_id;
  std::string barcode;
  std::string customer_id;
  std::string product_id;
  std::string storefront_id;

  IssueCategory issue_category = IssueCategory::kOther;
  std::string   issue_description;
  Severity      severity = Severity::kMedium;
  Priority      priority = Priority::kNormal;

  ClaimStatus                status = ClaimStatus::kPending;
  std::optional<ClaimStatus> previous_status;
  std::optional<ClaimStatus> disputed_from;
  uint64_t                   status_updated_at_ms = 0;
  std::string                status_updated_by;

  uint64_t    claim_date_ms   = 0;
  uint64_t    validated_at_ms = 0;
  std::string validated_by;
  uint64_t    completed_at_ms            = 0;
  uint64_t    estimated_completion_ms    = 0;
  uint64_t    actual_completion_ms       = 0;

  std::optional<ResolutionType> resolution_type;
  std::string                   resolution_notes;

  int64_t repair_cost_cents      = 0;
  int64_t shipping_cost_cents    = 0;
  int64_t replacement_cost_cents = 0;
  int64_t total_cost_cents       = 0;

  // Contact snapshot taken on submission
  std::string customer_name;
  std::string customer_email;
  std::string customer_phone;
  std::string pickup_address;

  std::string customer_notes;
  std::string admin_notes;
  std::string rejection_reason;

  std::string assigned_technician_id;
  std::string replacement_product_id;

  std::vector<std::string> tags;

  uint64_t version       = 1;
  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

// Append-only; sequence is assigned by the repository per claim.
struct TimelineEventRecord {
  std::string       id;
  std::string       claim_id;
  uint64_t          sequence   = 0;
  TimelineEventType event_type = TimelineEventType::kStatusUpdated;
  std::string       description;
  std::string       actor_id;
  ActorType         actor_type          = ActorType::kSystem;
  uint64_t          at_ms               = 0;
  bool              visible_to_customer = true;
};

// Replay guard for claim mutations keyed by (claim, request id).
struct IdempotencyRecord {
  std::string scope;
  std::string request_id;
  std::string result_ref;
  uint64_t    created_at_ms = 0;
};

} // namespace warranty::db::model
