#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/core/attachment_custodian.hpp"
#include "internal/core/batch_engine.hpp"
#include "internal/core/claim_workflow.hpp"
#include "internal/core/public_validator.hpp"
#include "internal/core/request_context.hpp"
#include "internal/core/warranty_registry.hpp"
#include "internal/db/api/types.hpp"
#include "internal/util/errors.hpp"
#include "warranty/v1.hpp"

namespace warranty::service {

/*
  Record <-> wire conversions.

  Statuses travel as their lowercase names. Unset timestamps (0 ms) are
  left unset on the wire, and unset wire timestamps read back as 0.
*/

core::RequestContext ToContext(const warranty::v1::RequestMeta& meta);
db::Pagination       ToPagination(const warranty::v1::Page& page, bool has_page);

// Parses a lowercase enum name or throws util::InvalidArgument naming the field.
template <typename Parse>
auto ParseField(std::string_view field, const std::string& value, Parse parse) -> std::decay_t<decltype(*parse(value))> {
  auto parsed = parse(value);
  if (!parsed) {
    throw util::InvalidArgument("unknown " + std::string(field) + " '" + value + "'", {{std::string(field), "unknown value", value}});
  }
  return *parsed;
}

// Same, but an empty string means "not given".
template <typename Parse>
auto ParseOptionalField(std::string_view field, const std::string& value, Parse parse) -> std::optional<std::decay_t<decltype(*parse(value))>> {
  if (value.empty()) return std::nullopt;
  return ParseField(field, value, parse);
}

void ToProto(const core::WarrantyView& view, warranty::v1::Barcode* out);
void ToProto(const db::model::BarcodeEventRecord& event, warranty::v1::BarcodeEvent* out);

void ToProto(const db::model::BatchRecord& batch, warranty::v1::Batch* out);
void ToProto(const core::BatchProgress& progress, warranty::v1::BatchProgress* out);
void ToProto(const db::model::CollisionRecord& collision, warranty::v1::Collision* out);

void ToProto(const core::ClaimView& view, warranty::v1::Claim* out);
void ToProto(const db::model::TimelineEventRecord& event, warranty::v1::TimelineEvent* out);

void ToProto(const db::model::RepairTicketRecord& ticket, warranty::v1::RepairTicket* out);
db::model::PartUsage  FromProto(const warranty::v1::PartUsage& part);
db::model::TestResult FromProto(const warranty::v1::TestResult& result);

void ToProto(const db::model::AttachmentRecord& attachment, warranty::v1::Attachment* out);

void ToProto(const core::WarrantySummary& summary, warranty::v1::WarrantySummary* out);
void ToProto(const core::CoverageTerms& terms, warranty::v1::CoverageTerms* out);

core::TransitionInput FromProto(const warranty::v1::TransitionOptions& options);

} // namespace warranty::service
