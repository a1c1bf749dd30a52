#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/service/service_context.hpp"

namespace warranty::factory {

/*
  Application

  Owns every long-lived object the server needs. Engines with background
  threads are stopped by Shutdown(), which the process calls after the
  gRPC server has drained.
*/
struct Application {
  std::shared_ptr<db::Repository>                 repository;
  service::ServiceContext                         context;
  std::vector<std::unique_ptr<::grpc::Service>>   grpc_services;

  void Shutdown();
};

// Repository for the configured backend, schema migrated.
std::shared_ptr<db::Repository> BuildRepository(const warranty::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the whole backend from runtime config and starts its
  workers. Interrupted batches are resumed unless batch.resume_interrupted
  is false.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types and adapters.
*/
Application Build(const warranty::runtime::config::RuntimeConfig& config);

}
