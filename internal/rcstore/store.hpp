#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/labels/selector.hpp"
#include "orchestrator/v1/types.pb.h"

namespace orchestrator::rcstore {

using RC = orchestrator::v1::ReplicationController;

/*
  Persistence for replication controller records.

  CRITICAL GUARANTEES:

  - Create assigns a fresh id, replicas_desired = 0, disabled = false
  - Get / SetDesiredReplicas / Disable / Delete on an unknown id (the empty
    id included) throw util::NotFound and change nothing
  - SetDesiredReplicas rejects n < 0 with util::InvalidArgument before any
    store access, and never drops a concurrent update to the same record
  - Disable is idempotent
  - Delete throws util::Conflict while replicas_desired > 0 and leaves the
    record untouched
*/
class Store {
 public:
  virtual ~Store() = default;

  virtual RC Create(const orchestrator::v1::PodManifest& manifest, const std::string& node_selector, const labels::Labels& pod_labels) = 0;

  virtual RC Get(const std::string& id) = 0;

  // unordered
  virtual std::vector<RC> List() = 0;

  virtual void SetDesiredReplicas(const std::string& id, int replicas) = 0;

  virtual void Disable(const std::string& id) = 0;

  virtual void Delete(const std::string& id) = 0;

  // Blocks up to timeout for a change to the record (including its removal).
  // Returns a token to pass as `after` next time.
  virtual uint64_t WaitForChange(const std::string& id, uint64_t after, std::chrono::milliseconds timeout) = 0;
};

// Validates the inputs and builds the record Create persists.
RC NewRecord(const orchestrator::v1::PodManifest& manifest, const std::string& node_selector, const labels::Labels& pod_labels);

void ValidateReplicas(int replicas);

} // namespace orchestrator::rcstore
