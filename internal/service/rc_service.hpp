#pragma once

#include "orchestrator/v1/rc_service.pb.h"
#include "service_context.hpp"

namespace orchestrator::service {

/*
  Driver-facing RC operations. Errors are util:: exceptions; the gRPC
  adapter maps them to status codes.
*/
class RcService {
 public:
  explicit RcService(ServiceContext ctx);

  orchestrator::v1::CreateReplicationControllerResponse Create(const orchestrator::v1::CreateReplicationControllerRequest& req);

  orchestrator::v1::GetReplicationControllerResponse Get(const orchestrator::v1::GetReplicationControllerRequest& req);

  orchestrator::v1::ListReplicationControllersResponse List(const orchestrator::v1::ListReplicationControllersRequest& req);

  orchestrator::v1::SetDesiredReplicasResponse SetDesiredReplicas(const orchestrator::v1::SetDesiredReplicasRequest& req);

  orchestrator::v1::DisableReplicationControllerResponse Disable(const orchestrator::v1::DisableReplicationControllerRequest& req);

  orchestrator::v1::DeleteReplicationControllerResponse Delete(const orchestrator::v1::DeleteReplicationControllerRequest& req);

  orchestrator::v1::CurrentNodesResponse CurrentNodes(const orchestrator::v1::CurrentNodesRequest& req);

  orchestrator::v1::StatusResponse Status(const orchestrator::v1::StatusRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace orchestrator::service
