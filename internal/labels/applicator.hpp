#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/labels/selector.hpp"
#include "internal/runtime/quit_signal.hpp"

namespace orchestrator::labels {

enum class EntityType { Pod, Node, ReplicationController };

const char* EntityTypeName(EntityType type);

// Throws util::InvalidArgument for unknown names.
EntityType ParseEntityType(std::string_view name);

struct Labeled {
  EntityType  type = EntityType::Node;
  std::string id;
  Labels      labels;

  bool operator==(const Labeled&) const = default;
};

using MatchCallback = std::function<void(const std::vector<Labeled>&)>;

/*
  Label store keyed by (entity type, entity id).

  GetLabels on an unknown entity is an empty set, never an error. Mutations
  are last-write-wins per key. GetMatches results are sorted by id.
*/
class Applicator {
 public:
  virtual ~Applicator() = default;

  // merge into the existing set
  virtual void SetLabels(EntityType type, const std::string& id, const Labels& labels) = 0;

  virtual void SetLabel(EntityType type, const std::string& id, const std::string& key, const std::string& value) {
    SetLabels(type, id, {{key, value}});
  }

  virtual Labels GetLabels(EntityType type, const std::string& id) = 0;

  virtual void RemoveLabels(EntityType type, const std::string& id, const std::vector<std::string>& keys) = 0;

  virtual void RemoveAllLabels(EntityType type, const std::string& id) = 0;

  virtual std::vector<Labeled> GetMatches(const Selector& selector, EntityType type) = 0;

  /*
    Blocks the calling thread and hands every distinct match snapshot to
    on_snapshot, starting with the current one. Returns only once cancel is
    requested. Query failures are logged and retried on the next slice.
  */
  void WatchMatches(const Selector& selector, EntityType type, const runtime::QuitSignal& cancel, const MatchCallback& on_snapshot);

  void SetWatchSlice(std::chrono::milliseconds slice) {
    watch_slice_ = slice;
  }

 protected:
  /*
    Blocks up to timeout for a label change on entities of type. Returns a
    token that differs from after once something changed.
  */
  virtual uint64_t WaitForChange(EntityType type, uint64_t after, std::chrono::milliseconds timeout) = 0;

  std::chrono::milliseconds watch_slice_{250};
};

} // namespace orchestrator::labels
