#pragma once

#include <string>
#include <vector>

#include "internal/labels/applicator.hpp"

namespace orchestrator::rc {

// Label a controller puts on every pod entity it places.
inline constexpr const char* kOwnerLabel = "replication_controller";

// replication_controller=<rc id>
labels::Selector OwnedBy(const std::string& rc_id);

// Pod entities are per placement: <node>/<pod id>.
std::string PodEntityId(const std::string& node, const std::string& pod_id);

// Node part of a pod entity id; empty if the id has no node.
std::string NodeOfPodEntity(const std::string& entity_id);

// Sorted, unique node names of the given pod entities.
std::vector<std::string> NodesOf(const std::vector<labels::Labeled>& pods);

// Nodes holding a pod entity labeled as owned by rc_id.
std::vector<std::string> OwnedNodes(labels::Applicator& applicator, const std::string& rc_id);

} // namespace orchestrator::rc
