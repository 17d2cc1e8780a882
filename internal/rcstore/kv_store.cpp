#include "kv_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <optional>
#include <stdexcept>

#include "internal/kp/paths.hpp"
#include "internal/kp/pod_store.hpp"
#include "internal/kv/errors.hpp"
#include "internal/kv/lock_guard.hpp"
#include "internal/observability/logging.hpp"
#include "internal/rc/ownership.hpp"
#include "internal/util/errors.hpp"

namespace orchestrator::rcstore {

namespace {

RC Decode(const kv::KVPair& pair) {
  RC record;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(pair.value, &record, options);
  if (!status.ok()) {
    throw std::runtime_error("corrupt replication controller at " + pair.key + ": " + std::string(status.message()));
  }
  return record;
}

std::string Encode(const RC& record) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(record, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode replication controller: " + std::string(status.message()));
  }
  return json;
}

// Destroys a short-lived session, which also frees any lock it still holds.
class SessionScope {
 public:
  SessionScope(std::shared_ptr<kv::Store> store, std::string id) : store_(std::move(store)), id_(std::move(id)) {
  }

  ~SessionScope() {
    const auto result = store_->DestroySession(id_);
    if (!result) {
      ORCHESTRATOR_LOG_WARN("destroy session failed", {observability::StringField("session", id_), observability::StringField("error", result.message)});
    }
  }

  SessionScope(const SessionScope&)            = delete;
  SessionScope& operator=(const SessionScope&) = delete;

  const std::string& Id() const {
    return id_;
  }

 private:
  std::shared_ptr<kv::Store> store_;
  std::string                id_;
};

} // namespace

KvStore::KvStore(std::shared_ptr<kv::Store> store, std::shared_ptr<labels::Applicator> applicator)
    : store_(std::move(store)), applicator_(std::move(applicator)) {
}

std::string KvStore::RecordKey(const std::string& id) {
  // no record can have an empty id, and an empty key would name the whole tree
  if (id.empty()) {
    throw util::NotFound("replication controller with empty id not found");
  }
  return kPrefix + id;
}

kv::KVPair KvStore::Load(const std::string& id) {
  auto pair = store_->Get(RecordKey(id));
  if (!pair) {
    throw util::NotFound("replication controller " + id + " not found");
  }
  return *pair;
}

RC KvStore::Create(const orchestrator::v1::PodManifest& manifest, const std::string& node_selector, const labels::Labels& pod_labels) {
  auto record = NewRecord(manifest, node_selector, pod_labels);

  kv::KVPair pair;
  pair.key   = RecordKey(record.id());
  pair.value = Encode(record);
  kv::ThrowIfError(store_->CheckAndSet(pair), "create " + pair.key);

  if (applicator_) {
    applicator_->SetLabel(labels::EntityType::ReplicationController, record.id(), kPodIdLabel, manifest.id());
  }

  ORCHESTRATOR_LOG_INFO("replication controller created",
                        {observability::StringField("rc", record.id()), observability::StringField("pod", manifest.id()),
                         observability::StringField("selector", record.node_selector())});
  return record;
}

RC KvStore::Get(const std::string& id) {
  return Decode(Load(id));
}

std::vector<RC> KvStore::List() {
  std::vector<RC> out;
  for (const auto& pair : store_->List(kPrefix)) {
    out.push_back(Decode(pair));
  }
  return out;
}

void KvStore::Update(const std::string& id, const std::function<bool(RC&)>& fn) {
  for (int attempt = 1; attempt <= kMaxCasAttempts; ++attempt) {
    auto pair   = Load(id);
    auto record = Decode(pair);
    if (!fn(record)) return;

    pair.value        = Encode(record);
    const auto result = store_->CheckAndSet(pair);
    if (result) return;

    // lost the race; the next Load sees the winner (or NotFound if deleted)
    if (result.code != kv::ErrorCode::Conflict) {
      kv::ThrowIfError(result, "update " + pair.key);
    }
  }

  throw util::Conflict("replication controller " + id + " kept changing; gave up after " + std::to_string(kMaxCasAttempts) + " attempts");
}

void KvStore::SetDesiredReplicas(const std::string& id, int replicas) {
  ValidateReplicas(replicas);

  Update(id, [&](RC& record) {
    if (record.replicas_desired() == replicas) return false;
    record.set_replicas_desired(replicas);
    return true;
  });
}

void KvStore::Disable(const std::string& id) {
  Update(id, [](RC& record) {
    if (record.disabled()) return false;
    record.set_disabled(true);
    return true;
  });
}

void KvStore::Delete(const std::string& id) {
  for (int attempt = 1;; ++attempt) {
    const auto pair   = Load(id);
    const auto record = Decode(pair);
    if (record.replicas_desired() > 0) {
      throw util::Conflict("replication controller " + id + " still wants " + std::to_string(record.replicas_desired()) +
                           " replicas; set them to 0 first");
    }

    const auto result = store_->DeleteCheckAndSet(pair.key, pair.modify_index);
    if (result) break;
    if (result.code == kv::ErrorCode::NotFound) {
      throw util::NotFound("replication controller " + id + " not found");
    }
    if (result.code != kv::ErrorCode::Conflict || attempt >= kMaxCasAttempts) {
      kv::ThrowIfError(result, "delete " + pair.key);
    }
  }

  if (applicator_) {
    RemovePlacements(id);
    applicator_->RemoveAllLabels(labels::EntityType::ReplicationController, id);
  }

  ORCHESTRATOR_LOG_INFO("replication controller deleted", {observability::StringField("rc", id)});
}

void KvStore::RemovePlacements(const std::string& id) {
  const auto owned = applicator_->GetMatches(rc::OwnedBy(id), labels::EntityType::Pod);
  if (owned.empty()) return;

  kp::PodStore pods(store_);
  SessionScope session(store_, store_->CreateSession("rcstore/delete/" + id, kPlacementSessionTtl));

  for (const auto& pod : owned) {
    const auto node = rc::NodeOfPodEntity(pod.id);
    if (node.empty()) {
      applicator_->RemoveAllLabels(labels::EntityType::Pod, pod.id);
      continue;
    }
    const auto pod_id = pod.id.substr(node.size() + 1);

    std::optional<kv::LockGuard> guard;
    try {
      guard.emplace(store_, kp::PodLockPath(kp::Tree::Intent, node, pod_id), session.Id());
    } catch (const util::Conflict&) {
      // only an unschedule holds this lock, and it removes the same entry
      ORCHESTRATOR_LOG_WARN("placement is being removed concurrently",
                            {observability::StringField("rc", id), observability::StringField("node", node), observability::StringField("pod", pod_id)});
      continue;
    }

    pods.DeletePod(kp::Tree::Intent, node, pod_id);
    applicator_->RemoveAllLabels(labels::EntityType::Pod, pod.id);
    guard->Release();

    ORCHESTRATOR_LOG_INFO("placement removed with its controller",
                          {observability::StringField("rc", id), observability::StringField("node", node), observability::StringField("pod", pod_id)});
  }
}

uint64_t KvStore::WaitForChange(const std::string& id, uint64_t after, std::chrono::milliseconds timeout) {
  return store_->WaitIndex(RecordKey(id), after, timeout);
}

} // namespace orchestrator::rcstore
