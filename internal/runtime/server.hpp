#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace warranty::runtime {

struct ServerOptions {
  std::string bind_address              = "0.0.0.0:50051";
  uint64_t    max_receive_message_bytes = 0; // 0 = gRPC default
};

class Server {
public:
  Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();

  // Stops accepting calls and waits for in-flight ones up to grace_ms.
  void Stop(uint64_t grace_ms = 5000);

  // Port actually bound; differs from the configured one for ":0".
  int Port() const { return selected_port_; }

private:
  ServerOptions                                  options_;
  std::vector<std::unique_ptr<::grpc::Service>>  services_;
  std::unique_ptr<::grpc::Server>                grpc_server_;
  int                                            selected_port_ = 0;
};

} // namespace warranty::runtime
