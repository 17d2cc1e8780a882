#include "rc_service.hpp"

#include <chrono>

#include "internal/kp/manifest.hpp"
#include "internal/labels/applicator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/rc/ownership.hpp"
#include "internal/rcstore/store.hpp"
#include "internal/status/tracker.hpp"
#include "internal/util/errors.hpp"

namespace orchestrator::service {

using namespace orchestrator::v1;

namespace {

// Logs failures with the route name and rethrows.
template <typename Fn>
auto Route(const char* route, Fn&& fn) -> decltype(fn()) {
  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto       resp    = fn();
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started_at);
    ORCHESTRATOR_LOG_DEBUG("RPC served", {observability::StringField("route", route), observability::IntField("latency_us", elapsed.count())});
    return resp;
  } catch (const std::exception& ex) {
    ORCHESTRATOR_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    throw;
  }
}

void RequireId(const std::string& id) {
  if (id.empty()) {
    throw util::InvalidArgument("replication controller id is required");
  }
}

} // namespace

RcService::RcService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateReplicationControllerResponse RcService::Create(const CreateReplicationControllerRequest& req) {
  return Route("ReplicationControllerService.Create", [&] {
    const auto     manifest = kp::ParseManifest(req.manifest_yaml());
    labels::Labels pod_labels(req.pod_labels().begin(), req.pod_labels().end());

    CreateReplicationControllerResponse resp;
    *resp.mutable_replication_controller() = ctx_.rcs->Create(manifest, req.node_selector(), pod_labels);
    return resp;
  });
}

GetReplicationControllerResponse RcService::Get(const GetReplicationControllerRequest& req) {
  return Route("ReplicationControllerService.Get", [&] {
    RequireId(req.id());
    GetReplicationControllerResponse resp;
    *resp.mutable_replication_controller() = ctx_.rcs->Get(req.id());
    return resp;
  });
}

ListReplicationControllersResponse RcService::List(const ListReplicationControllersRequest&) {
  return Route("ReplicationControllerService.List", [&] {
    ListReplicationControllersResponse resp;
    for (auto& record : ctx_.rcs->List()) {
      *resp.add_replication_controllers() = std::move(record);
    }
    return resp;
  });
}

SetDesiredReplicasResponse RcService::SetDesiredReplicas(const SetDesiredReplicasRequest& req) {
  return Route("ReplicationControllerService.SetDesiredReplicas", [&] {
    RequireId(req.id());
    ctx_.rcs->SetDesiredReplicas(req.id(), req.replicas_desired());
    return SetDesiredReplicasResponse{};
  });
}

DisableReplicationControllerResponse RcService::Disable(const DisableReplicationControllerRequest& req) {
  return Route("ReplicationControllerService.Disable", [&] {
    RequireId(req.id());
    ctx_.rcs->Disable(req.id());
    return DisableReplicationControllerResponse{};
  });
}

DeleteReplicationControllerResponse RcService::Delete(const DeleteReplicationControllerRequest& req) {
  return Route("ReplicationControllerService.Delete", [&] {
    RequireId(req.id());
    ctx_.rcs->Delete(req.id());
    return DeleteReplicationControllerResponse{};
  });
}

CurrentNodesResponse RcService::CurrentNodes(const CurrentNodesRequest& req) {
  return Route("ReplicationControllerService.CurrentNodes", [&] {
    RequireId(req.id());
    // NotFound for unknown ids rather than an empty list
    ctx_.rcs->Get(req.id());

    CurrentNodesResponse resp;
    for (const auto& node : rc::OwnedNodes(*ctx_.applicator, req.id())) {
      resp.add_nodes(node);
    }
    return resp;
  });
}

StatusResponse RcService::Status(const StatusRequest&) {
  return Route("ReplicationControllerService.Status", [&] {
    StatusResponse resp;
    for (const auto& loop : ctx_.tracker->Snapshot()) {
      auto* out = resp.add_loops();
      out->set_name(loop.name);
      out->set_consecutive_errors(loop.consecutive_errors);
      out->set_last_error(loop.last_error);
      out->set_last_success_unix_ms(loop.last_success_unix_ms);
    }
    return resp;
  });
}

} // namespace orchestrator::service
