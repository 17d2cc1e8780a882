#pragma once

#include <functional>
#include <memory>

#include "internal/kv/api/store.hpp"
#include "internal/labels/applicator.hpp"

namespace orchestrator::labels {

/*
  Applicator persisted in the coordination store.

    labels/<type>/<id>  ->  LabelSet JSON

  Every mutation is a check-and-set on the entity key. Conflicts and
  transient store failures are retried up to `retries` times; an entity whose
  set becomes empty has its key removed.
*/
class KvApplicator final : public Applicator {
 public:
  explicit KvApplicator(std::shared_ptr<kv::Store> store, int retries = 3);

  void   SetLabels(EntityType type, const std::string& id, const Labels& labels) override;
  Labels GetLabels(EntityType type, const std::string& id) override;
  void   RemoveLabels(EntityType type, const std::string& id, const std::vector<std::string>& keys) override;
  void   RemoveAllLabels(EntityType type, const std::string& id) override;

  std::vector<Labeled> GetMatches(const Selector& selector, EntityType type) override;

  static std::string TypePrefix(EntityType type);
  static std::string EntityKey(EntityType type, const std::string& id);

 protected:
  uint64_t WaitForChange(EntityType type, uint64_t after, std::chrono::milliseconds timeout) override;

 private:
  // fn returns false when it left the set untouched
  void Mutate(EntityType type, const std::string& id, const std::function<bool(Labels&)>& fn);

  std::shared_ptr<kv::Store> store_;
  int                        retries_;
};

} // namespace orchestrator::labels
