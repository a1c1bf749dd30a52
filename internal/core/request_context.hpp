#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/claim.hpp"
#include "internal/util/time.hpp"

namespace warranty::core {

inline constexpr std::string_view kRoleAdmin      = "admin";
inline constexpr std::string_view kRoleAgent      = "agent";
inline constexpr std::string_view kRoleTechnician = "technician";
inline constexpr std::string_view kRoleCustomer   = "customer";

// Verified identity handed in by the transport; trusted as-is.
struct Caller {
  std::string                 actor_id;
  warranty::model::ActorType  actor_type = warranty::model::ActorType::kSystem;
  std::vector<std::string>    roles;

  // admin satisfies every staff role check.
  bool HasRole(std::string_view role) const;
};

struct RequestContext {
  Caller      caller;
  std::string request_id;
  uint64_t    deadline_unix_ms = 0; // 0 = none
};

// Throws util::Forbidden unless the caller holds one of the roles.
void RequireRole(const RequestContext& ctx, std::initializer_list<std::string_view> roles);

// Throws util::DeadlineExceeded once the request deadline has passed.
void CheckDeadline(const RequestContext& ctx, const util::Clock& clock);

RequestContext SystemContext();

} // namespace warranty::core
