#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace orchestrator::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {
}

Server::~Server() {
  Stop();
  grpc_server_.reset();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials());

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_) {
    throw std::runtime_error("Failed to start gRPC server on " + bind_address_);
  }

  ORCHESTRATOR_LOG_INFO("rc-manager listening", {observability::StringField("address", bind_address_)});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

// Safe to call from another thread while Wait() blocks.
void Server::Stop() {
  if (!grpc_server_) return;
  std::call_once(shutdown_once_, [this] { grpc_server_->Shutdown(); });
}

} // namespace orchestrator::runtime
