#include "ownership.hpp"

#include <algorithm>

namespace orchestrator::rc {

labels::Selector OwnedBy(const std::string& rc_id) {
  labels::Selector selector;
  selector.Add({kOwnerLabel, labels::Operator::Equals, {rc_id}});
  return selector;
}

std::string PodEntityId(const std::string& node, const std::string& pod_id) {
  return node + "/" + pod_id;
}

std::string NodeOfPodEntity(const std::string& entity_id) {
  const auto slash = entity_id.rfind('/');
  if (slash == std::string::npos) return {};
  return entity_id.substr(0, slash);
}

std::vector<std::string> NodesOf(const std::vector<labels::Labeled>& pods) {
  std::vector<std::string> nodes;
  for (const auto& pod : pods) {
    auto node = NodeOfPodEntity(pod.id);
    if (!node.empty()) nodes.push_back(std::move(node));
  }
  std::sort(nodes.begin(), nodes.end());
  nodes.erase(std::unique(nodes.begin(), nodes.end()), nodes.end());
  return nodes;
}

std::vector<std::string> OwnedNodes(labels::Applicator& applicator, const std::string& rc_id) {
  return NodesOf(applicator.GetMatches(OwnedBy(rc_id), labels::EntityType::Pod));
}

} // namespace orchestrator::rc
