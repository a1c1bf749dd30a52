#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/batch.hpp"
#include "internal/model/claim.hpp"
#include "internal/model/repair.hpp"

namespace warranty::db {

struct Pagination {
  std::size_t limit  = 100;
  std::size_t offset = 0;
};

// Unset members do not filter. Millisecond ranges are inclusive; 0 = open.
struct BatchFilter {
  std::optional<warranty::model::BatchStatus>   status;
  std::optional<warranty::model::BatchPriority> priority;
  std::optional<std::string>                    product_id;
  std::optional<std::string>                    storefront_id;
  std::optional<std::string>                    created_by;
  uint64_t                                      created_from_ms = 0;
  uint64_t                                      created_to_ms   = 0;
};

struct ClaimFilter {
  std::optional<warranty::model::ClaimStatus>   status;
  std::optional<warranty::model::Priority>      priority;
  std::optional<warranty::model::Severity>      severity;
  std::optional<std::string>                    customer_id;
  std::optional<std::string>                    technician_id;
  std::optional<std::string>                    barcode_id;
  uint64_t                                      claim_date_from_ms = 0;
  uint64_t                                      claim_date_to_ms   = 0;
};

struct TicketFilter {
  std::optional<warranty::model::TicketStatus> status;
  std::optional<std::string>                   claim_id;
  std::optional<std::string>                   technician_id;
};

} // namespace warranty::db
