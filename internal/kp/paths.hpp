#pragma once

#include <string>
#include <string_view>

namespace orchestrator::kp {

/*
  Key layout of the pod trees.

    intent/<node>/<pod-id>      desired placement
    reality/<node>/<pod-id>     observed placement
    hooks/<pod-id>              lifecycle hooks, host agnostic
    lock/<pod path>             held only while a destructive action runs

  Every pod key in the store is built here.
*/
enum class Tree { Intent, Reality, Hooks };

inline constexpr std::string_view kLockTree = "lock";

const char* TreeName(Tree tree);

// Throws util::InvalidArgument for unknown names.
Tree ParseTree(std::string_view name);

// hooks ignores node. Throws util::InvalidArgument for an empty node otherwise.
std::string NodePath(Tree tree, const std::string& node);

std::string PodPath(Tree tree, const std::string& node, const std::string& pod_id);

std::string PodLockPath(Tree tree, const std::string& node, const std::string& pod_id);

std::string ReplicationControllerLockPath(const std::string& rc_id);

} // namespace orchestrator::kp
