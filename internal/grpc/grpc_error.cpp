#include "grpc_error.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "warranty/v1.hpp"

namespace warranty::grpc {

namespace {

::grpc::StatusCode CodeFor(std::string_view kind) {
  if (kind == "invalid_argument") return ::grpc::StatusCode::INVALID_ARGUMENT;
  if (kind == "not_found") return ::grpc::StatusCode::NOT_FOUND;
  if (kind == "already_exists") return ::grpc::StatusCode::ALREADY_EXISTS;
  if (kind == "conflict") return ::grpc::StatusCode::ABORTED;
  if (kind == "invalid_state" || kind == "invalid_transition" || kind == "precondition_failed") {
    return ::grpc::StatusCode::FAILED_PRECONDITION;
  }
  if (kind == "forbidden") return ::grpc::StatusCode::PERMISSION_DENIED;
  if (kind == "deadline_exceeded") return ::grpc::StatusCode::DEADLINE_EXCEEDED;
  if (kind == "dependency_failure") return ::grpc::StatusCode::UNAVAILABLE;
  if (kind == "payload_too_large") return ::grpc::StatusCode::RESOURCE_EXHAUSTED;
  return ::grpc::StatusCode::INTERNAL;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  using namespace warranty::util;

  const auto kind = ErrorKind(e);

  warranty::v1::ErrorDetail detail;
  detail.set_kind(std::string(kind));

  if (kind == "internal") {
    const auto* internal       = dynamic_cast<const Internal*>(&e);
    const auto  correlation_id = internal && !internal->CorrelationId().empty() ? internal->CorrelationId() : NewId();
    WARRANTY_LOG_ERROR("internal error", {warranty::observability::StringField("correlation_id", correlation_id),
                                          warranty::observability::StringField("error", e.what())});

    const auto message = "internal error (correlation id " + correlation_id + ")";
    detail.set_message(message);
    detail.set_correlation_id(correlation_id);
    return {::grpc::StatusCode::INTERNAL, message, detail.SerializeAsString()};
  }

  detail.set_message(e.what());
  if (const auto* invalid = dynamic_cast<const InvalidArgument*>(&e)) {
    for (const auto& v : invalid->Violations()) {
      auto* out = detail.add_violations();
      out->set_field(v.field);
      out->set_message(v.message);
      out->set_value(v.value);
    }
  }
  if (const auto* state = dynamic_cast<const InvalidState*>(&e)) {
    detail.set_current_state(state->CurrentState());
    for (const auto& action : state->LegalActions()) detail.add_legal_actions(action);
  }
  if (const auto* precondition = dynamic_cast<const PreconditionFailed*>(&e)) {
    detail.set_reason(precondition->Reason());
  }

  return {CodeFor(kind), e.what(), detail.SerializeAsString()};
}

} // namespace warranty::grpc
