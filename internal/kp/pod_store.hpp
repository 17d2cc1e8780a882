#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/kp/paths.hpp"
#include "internal/kv/api/store.hpp"
#include "orchestrator/v1/types.pb.h"

namespace orchestrator::kp {

/*
  Manifests at pod paths. The stored value is the raw manifest document, which
  is what a node agent reads.
*/
class PodStore {
 public:
  explicit PodStore(std::shared_ptr<kv::Store> store, int max_cas_attempts = 5);

  // Check-and-set write. Throws util::Conflict if the path keeps changing
  // underneath us for every attempt.
  void SetPod(Tree tree, const std::string& node, const orchestrator::v1::PodManifest& manifest);

  std::optional<orchestrator::v1::PodManifest> Pod(Tree tree, const std::string& node, const std::string& pod_id);

  // Idempotent.
  void DeletePod(Tree tree, const std::string& node, const std::string& pod_id);

  std::vector<orchestrator::v1::PodManifest> ListPods(Tree tree, const std::string& node);

  const std::shared_ptr<kv::Store>& Store() const {
    return store_;
  }

 private:
  std::shared_ptr<kv::Store> store_;
  int                        max_cas_attempts_;
};

} // namespace orchestrator::kp
