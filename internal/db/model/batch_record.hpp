#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/batch.hpp"

namespace warranty::db::model {

using BatchStatus         = warranty::model::BatchStatus;
using BatchPriority       = warranty::model::BatchPriority;
using CollisionType       = warranty::model::CollisionType;
using CollisionResolution = warranty::model::CollisionResolution;

/*
  Persistent generation batch row.

  Counters only ever grow while the batch is in_progress:
    successful_count + failed_count == generated_count <= requested_quantity
*/

struct BatchRecord {
  std::string id;
  std::string batch_number;
  std::string product_id;
  std::string storefront_id;
  std::string created_by;

  uint32_t requested_quantity = 0;
  uint32_t generated_count    = 0;
  uint32_t successful_count   = 0;
  uint32_t failed_count       = 0;
  uint32_t error_count        = 0;
  uint32_t collision_count    = 0;
  uint32_t retry_count        = 0;
  uint32_t max_retries        = 3;

  std::string              prefix;
  std::string              description;
  std::vector<std::string> tags;
  bool                     notify_on_complete = false;
  int32_t                  expiry_months      = 0;

  BatchPriority priority = BatchPriority::kNormal;
  BatchStatus   status   = BatchStatus::kPending;

  // Seed for the barcode generator; re-drawn when an interrupted batch resumes.
  uint64_t entropy_seed = 0;

  // Wall time spent generating, summed over commit chunks.
  uint64_t generation_time_ms = 0;

  uint64_t created_at_ms   = 0;
  uint64_t started_at_ms   = 0;
  uint64_t completed_at_ms = 0;
  uint64_t cancelled_at_ms = 0;
  uint64_t updated_at_ms   = 0;

  std::string cancelled_by;
  std::string cancel_reason;
  std::string last_error;
};

struct CollisionRecord {
  std::string         id;
  std::string         batch_id;
  std::string         candidate;
  CollisionType       type       = CollisionType::kDuplicateInStore;
  CollisionResolution resolution = CollisionResolution::kRegenerated;
  uint32_t            slot       = 0;
  uint32_t            attempt    = 0;
  uint64_t            detected_at_ms = 0;
  uint64_t            resolved_at_ms = 0;
};

} // namespace warranty::db::model
