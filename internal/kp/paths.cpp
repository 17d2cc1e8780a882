#include "paths.hpp"

#include "internal/util/errors.hpp"

namespace orchestrator::kp {

const char* TreeName(Tree tree) {
  switch (tree) {
    case Tree::Intent:
      return "intent";
    case Tree::Reality:
      return "reality";
    case Tree::Hooks:
      return "hooks";
  }
  return "unknown";
}

Tree ParseTree(std::string_view name) {
  if (name == "intent") return Tree::Intent;
  if (name == "reality") return Tree::Reality;
  if (name == "hooks") return Tree::Hooks;
  throw util::InvalidArgument("unknown pod tree: " + std::string(name));
}

std::string NodePath(Tree tree, const std::string& node) {
  if (tree == Tree::Hooks) {
    return TreeName(tree);
  }
  if (node.empty()) {
    throw util::InvalidArgument(std::string("unspecified node for ") + TreeName(tree) + " tree");
  }
  return std::string(TreeName(tree)) + "/" + node;
}

std::string PodPath(Tree tree, const std::string& node, const std::string& pod_id) {
  auto node_path = NodePath(tree, node);
  if (pod_id.empty()) {
    throw util::InvalidArgument("unspecified pod id under " + node_path);
  }
  return node_path + "/" + pod_id;
}

std::string PodLockPath(Tree tree, const std::string& node, const std::string& pod_id) {
  return std::string(kLockTree) + "/" + PodPath(tree, node, pod_id);
}

std::string ReplicationControllerLockPath(const std::string& rc_id) {
  if (rc_id.empty()) {
    throw util::InvalidArgument("unspecified replication controller id");
  }
  return std::string(kLockTree) + "/replication_controllers/" + rc_id;
}

} // namespace orchestrator::kp
