#pragma once

#include <condition_variable>
#include <map>
#include <mutex>
#include <utility>

#include "internal/labels/applicator.hpp"

namespace orchestrator::labels {

/*
  In-memory applicator for tests and dry runs.
*/
class FakeApplicator final : public Applicator {
 public:
  void   SetLabels(EntityType type, const std::string& id, const Labels& labels) override;
  Labels GetLabels(EntityType type, const std::string& id) override;
  void   RemoveLabels(EntityType type, const std::string& id, const std::vector<std::string>& keys) override;
  void   RemoveAllLabels(EntityType type, const std::string& id) override;

  std::vector<Labeled> GetMatches(const Selector& selector, EntityType type) override;

  // every labeled entity of every type
  std::vector<Labeled> All();

 protected:
  uint64_t WaitForChange(EntityType type, uint64_t after, std::chrono::milliseconds timeout) override;

 private:
  void BumpLocked(EntityType type);

  std::mutex              mutex_;
  std::condition_variable changed_;

  std::map<std::pair<EntityType, std::string>, Labels> entities_;
  std::map<EntityType, uint64_t>                       versions_;
};

} // namespace orchestrator::labels
