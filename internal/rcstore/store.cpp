#include "store.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace orchestrator::rcstore {

RC NewRecord(const orchestrator::v1::PodManifest& manifest, const std::string& node_selector, const labels::Labels& pod_labels) {
  if (manifest.id().empty()) {
    throw util::InvalidArgument("manifest has no pod id");
  }
  const auto selector = labels::Selector::Parse(node_selector);

  RC record;
  record.set_id(util::GenerateUUIDString());
  *record.mutable_manifest() = manifest;
  record.set_node_selector(selector.String());
  for (const auto& [key, value] : pod_labels) {
    if (key.empty()) throw util::InvalidArgument("empty pod label key");
    (*record.mutable_pod_labels())[key] = value;
  }
  record.set_disabled(false);
  record.set_replicas_desired(0);
  return record;
}

void ValidateReplicas(int replicas) {
  if (replicas < 0) {
    throw util::InvalidArgument("replicas_desired must be >= 0, got " + std::to_string(replicas));
  }
}

} // namespace orchestrator::rcstore
