#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/claim.hpp"
#include "internal/model/repair.hpp"

namespace warranty::db::model {

using TicketStatus           = warranty::model::TicketStatus;
using QualityCheckStatus     = warranty::model::QualityCheckStatus;
using CustomerApprovalStatus = warranty::model::CustomerApprovalStatus;

struct PartUsage {
  std::string name;
  std::string part_number;
  uint32_t    quantity        = 1;
  int64_t     unit_cost_cents = 0;
};

struct TestResult {
  std::string name;
  bool        passed = false;
  std::string notes;
};

/*
  Persistent repair ticket row.

  total_cost_cents is written on completion and cleared only when a QA
  rejection reopens the ticket for another completion cycle.
*/

struct RepairTicketRecord {
  std::string  id;
  std::string  ticket_number;
  std::string  claim_id;
  TicketStatus status   = TicketStatus::kPending;
  warranty::model::Priority priority = warranty::model::Priority::kNormal;

  std::string assigned_technician_id;
  uint64_t    assigned_at_ms = 0;

  double   estimated_hours = 0.0;
  double   actual_hours    = 0.0;
  uint64_t estimated_completion_ms = 0;
  uint64_t actual_completion_ms    = 0;
  uint64_t started_at_ms           = 0;

  std::string description;
  std::string special_instructions;
  std::string repair_notes;

  std::vector<PartUsage>  required_parts;
  std::vector<PartUsage>  used_parts;
  std::vector<TestResult> test_results;

  int64_t labor_cost_cents     = 0;
  int64_t parts_cost_cents     = 0;
  int64_t total_cost_cents     = 0;
  int64_t estimated_cost_cents = 0;

  QualityCheckStatus quality_check_status = QualityCheckStatus::kPending;
  std::string        quality_checked_by;
  uint64_t           quality_checked_at_ms = 0;
  std::string        quality_notes;

  bool                   customer_approval_required = false;
  CustomerApprovalStatus customer_approval_status   = CustomerApprovalStatus::kNotRequired;
  uint64_t               customer_approved_at_ms    = 0;
  std::string            customer_approval_notes;

  uint32_t reopen_count  = 0;
  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace warranty::db::model
