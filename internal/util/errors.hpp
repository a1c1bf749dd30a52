#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace warranty::util {

/*
  Central error types.

  Core code throws these; the gRPC layer translates them to status codes
  and ErrorDetail payloads. Repository code never throws them directly,
  it returns db::Result and core converts.
*/

struct FieldViolation {
  std::string field;
  std::string message;
  std::string value;
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg, std::vector<FieldViolation> violations = {})
      : std::runtime_error(msg), violations_(std::move(violations)) {
  }

  const std::vector<FieldViolation>& Violations() const {
    return violations_;
  }

 private:
  std::vector<FieldViolation> violations_;
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optimistic-concurrency loss, double activation, duplicate submission.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Unique key collision. Distinct from Conflict so collision handling can react.
class AlreadyExists : public Conflict {
 public:
  explicit AlreadyExists(const std::string& msg) : Conflict(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg, std::string current_state = {}, std::vector<std::string> legal_actions = {})
      : std::runtime_error(msg), current_state_(std::move(current_state)), legal_actions_(std::move(legal_actions)) {
  }

  const std::string& CurrentState() const {
    return current_state_;
  }

  const std::vector<std::string>& LegalActions() const {
    return legal_actions_;
  }

 private:
  std::string              current_state_;
  std::vector<std::string> legal_actions_;
};

class InvalidTransition : public InvalidState {
 public:
  InvalidTransition(const std::string& msg, std::string current_state, std::vector<std::string> legal_actions)
      : InvalidState(msg, std::move(current_state), std::move(legal_actions)) {
  }
};

class PreconditionFailed : public std::runtime_error {
 public:
  PreconditionFailed(std::string reason, const std::string& msg) : std::runtime_error(msg), reason_(std::move(reason)) {
  }

  const std::string& Reason() const {
    return reason_;
  }

 private:
  std::string reason_;
};

class Forbidden : public std::runtime_error {
 public:
  explicit Forbidden(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DeadlineExceeded : public std::runtime_error {
 public:
  explicit DeadlineExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DependencyFailure : public std::runtime_error {
 public:
  explicit DependencyFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PayloadTooLarge : public std::runtime_error {
 public:
  explicit PayloadTooLarge(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Internal : public std::runtime_error {
 public:
  Internal(std::string correlation_id, const std::string& msg) : std::runtime_error(msg), correlation_id_(std::move(correlation_id)) {
  }

  const std::string& CorrelationId() const {
    return correlation_id_;
  }

 private:
  std::string correlation_id_;
};

// Lower-case kind name of a util exception; "internal" for anything else.
inline std::string_view ErrorKind(const std::exception& e) {
  if (dynamic_cast<const InvalidArgument*>(&e)) return "invalid_argument";
  if (dynamic_cast<const NotFound*>(&e)) return "not_found";
  if (dynamic_cast<const AlreadyExists*>(&e)) return "already_exists";
  if (dynamic_cast<const Conflict*>(&e)) return "conflict";
  if (dynamic_cast<const InvalidTransition*>(&e)) return "invalid_transition";
  if (dynamic_cast<const InvalidState*>(&e)) return "invalid_state";
  if (dynamic_cast<const PreconditionFailed*>(&e)) return "precondition_failed";
  if (dynamic_cast<const Forbidden*>(&e)) return "forbidden";
  if (dynamic_cast<const DeadlineExceeded*>(&e)) return "deadline_exceeded";
  if (dynamic_cast<const DependencyFailure*>(&e)) return "dependency_failure";
  if (dynamic_cast<const PayloadTooLarge*>(&e)) return "payload_too_large";
  return "internal";
}

} // namespace warranty::util
