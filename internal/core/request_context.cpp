#include "request_context.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace warranty::core {

bool Caller::HasRole(std::string_view role) const {
  return std::any_of(roles.begin(), roles.end(), [&](const std::string& r) {
    return r == role || (r == kRoleAdmin && role != kRoleCustomer);
  });
}

void RequireRole(const RequestContext& ctx, std::initializer_list<std::string_view> roles) {
  for (auto role : roles) {
    if (ctx.caller.HasRole(role)) return;
  }

  std::string wanted;
  for (auto role : roles) {
    if (!wanted.empty()) wanted += "|";
    wanted += role;
  }
  throw util::Forbidden("caller '" + ctx.caller.actor_id + "' lacks role " + wanted);
}

void CheckDeadline(const RequestContext& ctx, const util::Clock& clock) {
  if (ctx.deadline_unix_ms == 0) return;
  if (util::ToUnixMillis(clock.Now()) > ctx.deadline_unix_ms) {
    throw util::DeadlineExceeded("request deadline exceeded");
  }
}

RequestContext SystemContext() {
  RequestContext ctx;
  ctx.caller.actor_id   = "system";
  ctx.caller.actor_type = warranty::model::ActorType::kSystem;
  ctx.caller.roles      = {std::string(kRoleAdmin)};
  return ctx;
}

} // namespace warranty::core
