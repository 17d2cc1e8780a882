#include "rc_server.hpp"

#include "grpc_error.hpp"

namespace orchestrator::grpc {

using namespace orchestrator::v1;

namespace {

template <typename Req, typename Resp, typename Fn>
::grpc::Status Handle(const Req* req, Resp* resp, Fn&& fn) {
  try {
    *resp = fn(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

RcServer::RcServer(std::shared_ptr<orchestrator::service::RcService> svc) : service_(std::move(svc)) {
}

::grpc::Status RcServer::Create(::grpc::ServerContext*, const CreateReplicationControllerRequest* req, CreateReplicationControllerResponse* resp) {
  return Handle(req, resp, [&](const auto& r) { return service_->Create(r); });
}

::grpc::Status RcServer::Get(::grpc::ServerContext*, const GetReplicationControllerRequest* req, GetReplicationControllerResponse* resp) {
  return Handle(req, resp, [&](const auto& r) { return service_->Get(r); });
}

::grpc::Status RcServer::List(::grpc::ServerContext*, const ListReplicationControllersRequest* req, ListReplicationControllersResponse* resp) {
  return Handle(req, resp, [&](const auto& r) { return service_->List(r); });
}

::grpc::Status RcServer::SetDesiredReplicas(::grpc::ServerContext*, const SetDesiredReplicasRequest* req, SetDesiredReplicasResponse* resp) {
  return Handle(req, resp, [&](const auto& r) { return service_->SetDesiredReplicas(r); });
}

::grpc::Status RcServer::Disable(::grpc::ServerContext*, const DisableReplicationControllerRequest* req, DisableReplicationControllerResponse* resp) {
  return Handle(req, resp, [&](const auto& r) { return service_->Disable(r); });
}

::grpc::Status RcServer::Delete(::grpc::ServerContext*, const DeleteReplicationControllerRequest* req, DeleteReplicationControllerResponse* resp) {
  return Handle(req, resp, [&](const auto& r) { return service_->Delete(r); });
}

::grpc::Status RcServer::CurrentNodes(::grpc::ServerContext*, const CurrentNodesRequest* req, CurrentNodesResponse* resp) {
  return Handle(req, resp, [&](const auto& r) { return service_->CurrentNodes(r); });
}

::grpc::Status RcServer::Status(::grpc::ServerContext*, const StatusRequest* req, StatusResponse* resp) {
  return Handle(req, resp, [&](const auto& r) { return service_->Status(r); });
}

} // namespace orchestrator::grpc
