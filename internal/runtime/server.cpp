#include "server.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace warranty::runtime {

Server::Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services)
    : options_(std::move(options)), services_(std::move(services)) {}

Server::~Server() {
  Stop(0);
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  builder.AddListeningPort(options_.bind_address, ::grpc::InsecureServerCredentials(), &selected_port_);
  if (options_.max_receive_message_bytes > 0) {
    builder.SetMaxReceiveMessageSize(static_cast<int>(options_.max_receive_message_bytes));
  }

  // Register gRPC services (thin adapters)
  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_ || selected_port_ == 0) {
    throw std::runtime_error("Failed to start gRPC server on " + options_.bind_address);
  }

  WARRANTY_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", options_.bind_address),
                                              observability::IntField("port", selected_port_),
                                              observability::IntField("services", static_cast<int64_t>(services_.size()))});
}

void Server::Stop(uint64_t grace_ms) {
  if (grpc_server_) {
    grpc_server_->Shutdown(std::chrono::system_clock::now() + std::chrono::milliseconds(grace_ms));
    grpc_server_.reset();
    WARRANTY_LOG_INFO("gRPC server stopped");
  }
}

} // namespace warranty::runtime
