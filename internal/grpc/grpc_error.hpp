#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace warranty::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  Every non-OK status carries a serialized warranty.core.v1.ErrorDetail in
  its details. Unclassified exceptions become INTERNAL with only a
  correlation id in the message; the underlying error is logged under
  that id.
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace warranty::grpc
