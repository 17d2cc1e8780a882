#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/rc_server.hpp"
#include "internal/kv/memory/memory_store.hpp"
#include "internal/labels/fake_applicator.hpp"
#include "internal/rcstore/kv_store.hpp"
#include "internal/service/rc_service.hpp"
#include "internal/status/tracker.hpp"
#include "internal/util/errors.hpp"

namespace {

orchestrator::service::ServiceContext BuildServiceContext() {
  orchestrator::service::ServiceContext ctx;
  auto                                  applicator = std::make_shared<orchestrator::labels::FakeApplicator>();
  ctx.rcs        = std::make_shared<orchestrator::rcstore::KvStore>(std::make_shared<orchestrator::kv::memory::MemoryStore>(), applicator);
  ctx.applicator = applicator;
  ctx.tracker    = std::make_shared<orchestrator::status::Tracker>();
  return ctx;
}

void TestExceptionMapping() {
  using orchestrator::grpc::ToStatus;

  assert(ToStatus(orchestrator::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(orchestrator::util::Conflict("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(orchestrator::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(orchestrator::util::StoreUnavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(orchestrator::util::Unsupported("x")).error_code() == ::grpc::StatusCode::UNIMPLEMENTED);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(orchestrator::util::NotFound("rc abc")).error_message() == "rc abc");
}

void TestGetMissingReturnsNotFound() {
  orchestrator::grpc::RcServer server(std::make_shared<orchestrator::service::RcService>(BuildServiceContext()));

  orchestrator::v1::GetReplicationControllerRequest  req;
  orchestrator::v1::GetReplicationControllerResponse resp;
  req.set_id("BOGUSBOGUS");
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.Get(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestDeleteWithReplicasReturnsFailedPrecondition() {
  orchestrator::grpc::RcServer server(std::make_shared<orchestrator::service::RcService>(BuildServiceContext()));

  orchestrator::v1::CreateReplicationControllerRequest  create;
  orchestrator::v1::CreateReplicationControllerResponse created;
  create.set_manifest_yaml("id: hello\n");
  ::grpc::ServerContext create_ctx;
  assert(server.Create(&create_ctx, &create, &created).ok());

  orchestrator::v1::SetDesiredReplicasRequest  set;
  orchestrator::v1::SetDesiredReplicasResponse set_resp;
  set.set_id(created.replication_controller().id());
  set.set_replicas_desired(1);
  ::grpc::ServerContext set_ctx;
  assert(server.SetDesiredReplicas(&set_ctx, &set, &set_resp).ok());

  orchestrator::v1::DeleteReplicationControllerRequest  del;
  orchestrator::v1::DeleteReplicationControllerResponse del_resp;
  del.set_id(created.replication_controller().id());
  ::grpc::ServerContext del_ctx;
  assert(server.Delete(&del_ctx, &del, &del_resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestNegativeReplicasReturnsInvalidArgument() {
  orchestrator::grpc::RcServer server(std::make_shared<orchestrator::service::RcService>(BuildServiceContext()));

  orchestrator::v1::SetDesiredReplicasRequest  set;
  orchestrator::v1::SetDesiredReplicasResponse resp;
  set.set_id("anything");
  set.set_replicas_desired(-3);
  ::grpc::ServerContext grpc_ctx;
  assert(server.SetDesiredReplicas(&grpc_ctx, &set, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestGetMissingReturnsNotFound();
  TestDeleteWithReplicasReturnsFailedPrecondition();
  TestNegativeReplicasReturnsInvalidArgument();

  std::cout << "orchestrator_unit_grpc_status: pass\n";
  return 0;
}
