#include "pod_store.hpp"

#include "internal/kp/manifest.hpp"
#include "internal/kv/errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace orchestrator::kp {

PodStore::PodStore(std::shared_ptr<kv::Store> store, int max_cas_attempts)
    : store_(std::move(store)), max_cas_attempts_(max_cas_attempts < 1 ? 1 : max_cas_attempts) {
}

void PodStore::SetPod(Tree tree, const std::string& node, const orchestrator::v1::PodManifest& manifest) {
  const auto path = PodPath(tree, node, manifest.id());

  for (int attempt = 1; attempt <= max_cas_attempts_; ++attempt) {
    const auto current = store_->Get(path);
    if (current && current->value == manifest.raw_yaml()) {
      return;
    }

    kv::KVPair pair;
    pair.key          = path;
    pair.value        = manifest.raw_yaml();
    pair.modify_index = current ? current->modify_index : 0;

    const auto result = store_->CheckAndSet(pair);
    if (result) {
      ORCHESTRATOR_LOG_DEBUG("pod written", {observability::StringField("path", path), observability::StringField("sha256", manifest.sha256())});
      return;
    }
    if (result.code != kv::ErrorCode::Conflict) {
      kv::ThrowIfError(result, "write " + path);
    }
  }

  throw util::Conflict("write " + path + ": lost check-and-set race " + std::to_string(max_cas_attempts_) + " times");
}

std::optional<orchestrator::v1::PodManifest> PodStore::Pod(Tree tree, const std::string& node, const std::string& pod_id) {
  const auto pair = store_->Get(PodPath(tree, node, pod_id));
  if (!pair) return std::nullopt;
  return ParseManifest(pair->value);
}

void PodStore::DeletePod(Tree tree, const std::string& node, const std::string& pod_id) {
  const auto path = PodPath(tree, node, pod_id);
  kv::ThrowIfError(store_->Delete(path), "delete " + path);
}

std::vector<orchestrator::v1::PodManifest> PodStore::ListPods(Tree tree, const std::string& node) {
  const auto prefix = NodePath(tree, node) + "/";

  std::vector<orchestrator::v1::PodManifest> pods;
  for (const auto& pair : store_->List(prefix)) {
    // intent/<node>/<pod> only; deeper keys are not pods
    if (pair.key.find('/', prefix.size()) != std::string::npos) continue;
    pods.push_back(ParseManifest(pair.value));
  }
  return pods;
}

} // namespace orchestrator::kp
