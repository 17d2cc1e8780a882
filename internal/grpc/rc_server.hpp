#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/rc_service.hpp"
#include "orchestrator/v1/rc_service.grpc.pb.h"

namespace orchestrator::grpc {

class RcServer final : public orchestrator::v1::ReplicationControllerService::Service {
 public:
  explicit RcServer(std::shared_ptr<orchestrator::service::RcService> svc);

  ::grpc::Status Create(::grpc::ServerContext*,
                        const orchestrator::v1::CreateReplicationControllerRequest*,
                        orchestrator::v1::CreateReplicationControllerResponse*) override;

  ::grpc::Status Get(::grpc::ServerContext*, const orchestrator::v1::GetReplicationControllerRequest*, orchestrator::v1::GetReplicationControllerResponse*) override;

  ::grpc::Status List(::grpc::ServerContext*,
                      const orchestrator::v1::ListReplicationControllersRequest*,
                      orchestrator::v1::ListReplicationControllersResponse*) override;

  ::grpc::Status SetDesiredReplicas(::grpc::ServerContext*, const orchestrator::v1::SetDesiredReplicasRequest*, orchestrator::v1::SetDesiredReplicasResponse*) override;

  ::grpc::Status Disable(::grpc::ServerContext*,
                         const orchestrator::v1::DisableReplicationControllerRequest*,
                         orchestrator::v1::DisableReplicationControllerResponse*) override;

  ::grpc::Status Delete(::grpc::ServerContext*,
                        const orchestrator::v1::DeleteReplicationControllerRequest*,
                        orchestrator::v1::DeleteReplicationControllerResponse*) override;

  ::grpc::Status CurrentNodes(::grpc::ServerContext*, const orchestrator::v1::CurrentNodesRequest*, orchestrator::v1::CurrentNodesResponse*) override;

  ::grpc::Status Status(::grpc::ServerContext*, const orchestrator::v1::StatusRequest*, orchestrator::v1::StatusResponse*) override;

 private:
  std::shared_ptr<orchestrator::service::RcService> service_;
};

} // namespace orchestrator::grpc
