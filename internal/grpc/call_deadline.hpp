#pragma once

#include <chrono>
#include <cstdint>

#include <grpcpp/grpcpp.h>

namespace warranty::grpc {

// Call deadline in unix ms, or 0 when the client set none.
inline uint64_t CallDeadlineMs(const ::grpc::ServerContext* ctx) {
  if (!ctx) return 0;
  const auto deadline = ctx->deadline();
  // Deadlines further out than a day are treated as unset.
  if (deadline > std::chrono::system_clock::now() + std::chrono::hours(24)) return 0;
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(deadline.time_since_epoch()).count());
}

// Copy of req whose meta.deadline_unix_ms falls back to the call deadline.
template <typename Req>
Req WithCallDeadline(const ::grpc::ServerContext* ctx, const Req& req) {
  Req copy = req;
  if (copy.meta().deadline_unix_ms() == 0) {
    if (const auto ms = CallDeadlineMs(ctx); ms != 0) copy.mutable_meta()->set_deadline_unix_ms(ms);
  }
  return copy;
}

} // namespace warranty::grpc
