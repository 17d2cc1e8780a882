#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "orchestrator/v1/rc_service.grpc.pb.h"

using namespace orchestrator::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  rcctl <addr> create <manifest.yaml> <node-selector> [label=value ...]\n"
            << "  rcctl <addr> get <id>\n"
            << "  rcctl <addr> list\n"
            << "  rcctl <addr> set-replicas <id> <n>\n"
            << "  rcctl <addr> disable <id>\n"
            << "  rcctl <addr> delete <id>\n"
            << "  rcctl <addr> nodes <id>\n"
            << "  rcctl <addr> status\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

static void PrintRC(const ReplicationController& rc) {
  std::cout << "id=" << rc.id() << " pod=" << rc.manifest().id() << " sha256=" << rc.manifest().sha256() << " selector=\"" << rc.node_selector()
            << "\" replicas_desired=" << rc.replicas_desired() << " disabled=" << (rc.disabled() ? "true" : "false") << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = ReplicationControllerService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    std::ifstream in(argv[3], std::ios::binary);
    if (!in) {
      std::cerr << "cannot open manifest " << argv[3] << "\n";
      return 1;
    }
    std::ostringstream manifest;
    manifest << in.rdbuf();

    CreateReplicationControllerRequest req;
    req.set_manifest_yaml(manifest.str());
    req.set_node_selector(argv[4]);
    for (int i = 5; i < argc; ++i) {
      const std::string label = argv[i];
      const auto        eq    = label.find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << "invalid label '" << label << "', expected key=value\n";
        return 1;
      }
      (*req.mutable_pod_labels())[label.substr(0, eq)] = label.substr(eq + 1);
    }

    CreateReplicationControllerResponse resp;
    auto                                status = stub->Create(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintRC(resp.replication_controller());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetReplicationControllerRequest req;
    req.set_id(argv[3]);

    GetReplicationControllerResponse resp;
    auto                             status = stub->Get(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::string json;
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    if (!google::protobuf::util::MessageToJsonString(resp.replication_controller(), &json, options).ok()) {
      PrintRC(resp.replication_controller());
      return 0;
    }
    std::cout << json;
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListReplicationControllersResponse resp;
    auto                               status = stub->List(&ctx, ListReplicationControllersRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& rc : resp.replication_controllers()) {
      PrintRC(rc);
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "set-replicas") {
    if (argc < 5) return 1;

    int replicas = 0;
    try {
      replicas = std::stoi(argv[4]);
    } catch (const std::exception&) {
      std::cerr << "invalid replica count: " << argv[4] << "\n";
      return 1;
    }

    SetDesiredReplicasRequest req;
    req.set_id(argv[3]);
    req.set_replicas_desired(replicas);

    SetDesiredReplicasResponse resp;
    auto                       status = stub->SetDesiredReplicas(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "replicas_desired=" << replicas << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "disable") {
    if (argc < 4) return 1;

    DisableReplicationControllerRequest req;
    req.set_id(argv[3]);

    DisableReplicationControllerResponse resp;
    auto                                 status = stub->Disable(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "disabled\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (argc < 4) return 1;

    DeleteReplicationControllerRequest req;
    req.set_id(argv[3]);

    DeleteReplicationControllerResponse resp;
    auto                                status = stub->Delete(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "nodes") {
    if (argc < 4) return 1;

    CurrentNodesRequest req;
    req.set_id(argv[3]);

    CurrentNodesResponse resp;
    auto                 status = stub->CurrentNodes(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& node : resp.nodes()) {
      std::cout << node << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    StatusResponse resp;
    auto           status = stub->Status(&ctx, StatusRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& loop : resp.loops()) {
      std::cout << loop.name() << " consecutive_errors=" << loop.consecutive_errors() << " last_success_unix_ms=" << loop.last_success_unix_ms();
      if (!loop.last_error().empty()) std::cout << " last_error=\"" << loop.last_error() << "\"";
      std::cout << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
