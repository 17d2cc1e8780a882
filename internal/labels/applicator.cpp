#include "applicator.hpp"

#include <optional>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace orchestrator::labels {

const char* EntityTypeName(EntityType type) {
  switch (type) {
    case EntityType::Pod:
      return "pod";
    case EntityType::Node:
      return "node";
    case EntityType::ReplicationController:
      return "replication_controller";
  }
  return "unknown";
}

EntityType ParseEntityType(std::string_view name) {
  if (name == "pod") return EntityType::Pod;
  if (name == "node") return EntityType::Node;
  if (name == "replication_controller") return EntityType::ReplicationController;
  throw util::InvalidArgument("unknown label entity type: " + std::string(name));
}

void Applicator::WatchMatches(const Selector& selector, EntityType type, const runtime::QuitSignal& cancel, const MatchCallback& on_snapshot) {
  std::optional<std::vector<Labeled>> last;
  uint64_t                            token = 0;

  while (!cancel.IsRequested()) {
    try {
      auto snapshot = GetMatches(selector, type);
      if (!last || *last != snapshot) {
        on_snapshot(snapshot);
        last = std::move(snapshot);
      }
      token = WaitForChange(type, token, watch_slice_);
    } catch (const std::exception& e) {
      ORCHESTRATOR_LOG_WARN("label watch query failed",
                            {observability::StringField("selector", selector.String()), observability::StringField("type", EntityTypeName(type)),
                             observability::StringField("error", e.what())});
      cancel.WaitFor(watch_slice_);
    }
  }
}

} // namespace orchestrator::labels
