#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include "internal/kv/api/store.hpp"
#include "internal/labels/applicator.hpp"
#include "internal/rcstore/store.hpp"

namespace orchestrator::rcstore {

/*
  RC records in the coordination store.

    replication_controllers/<id>  ->  ReplicationController JSON

  Transient failures are retried by the kv::RetryingStore the caller hands
  in. When an applicator is given, Create labels the RC entity with
  pod_id=<manifest id>. Delete removes the intent entry of every pod entity
  the RC owns, strips those pods' labels, then strips the RC entity's labels;
  once ownership labels are gone nothing could find those entries again.
*/
class KvStore final : public Store {
 public:
  static constexpr const char* kPrefix         = "replication_controllers/";
  static constexpr const char* kPodIdLabel     = "pod_id";
  static constexpr int         kMaxCasAttempts = 32;

  static constexpr std::chrono::milliseconds kPlacementSessionTtl{30000};

  explicit KvStore(std::shared_ptr<kv::Store> store, std::shared_ptr<labels::Applicator> applicator = nullptr);

  RC Create(const orchestrator::v1::PodManifest& manifest, const std::string& node_selector, const labels::Labels& pod_labels) override;

  RC              Get(const std::string& id) override;
  std::vector<RC> List() override;

  void SetDesiredReplicas(const std::string& id, int replicas) override;
  void Disable(const std::string& id) override;
  void Delete(const std::string& id) override;

  uint64_t WaitForChange(const std::string& id, uint64_t after, std::chrono::milliseconds timeout) override;

  static std::string RecordKey(const std::string& id);

 private:
  // Read-modify-write under check-and-set. fn returns false for no-op.
  void Update(const std::string& id, const std::function<bool(RC&)>& fn);

  kv::KVPair Load(const std::string& id);

  // Intent entries and labels of the pods owned by id.
  void RemovePlacements(const std::string& id);

  std::shared_ptr<kv::Store>          store_;
  std::shared_ptr<labels::Applicator> applicator_;
};

} // namespace orchestrator::rcstore
