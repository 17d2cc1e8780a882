#include "fake_applicator.hpp"

namespace orchestrator::labels {

void FakeApplicator::BumpLocked(EntityType type) {
  ++versions_[type];
  changed_.notify_all();
}

void FakeApplicator::SetLabels(EntityType type, const std::string& id, const Labels& labels) {
  std::lock_guard lock(mutex_);
  auto&           existing = entities_[{type, id}];
  for (const auto& [key, value] : labels) {
    existing[key] = value;
  }
  if (existing.empty()) entities_.erase({type, id});
  BumpLocked(type);
}

Labels FakeApplicator::GetLabels(EntityType type, const std::string& id) {
  std::lock_guard lock(mutex_);
  auto            it = entities_.find({type, id});
  if (it == entities_.end()) return {};
  return it->second;
}

void FakeApplicator::RemoveLabels(EntityType type, const std::string& id, const std::vector<std::string>& keys) {
  std::lock_guard lock(mutex_);
  auto            it = entities_.find({type, id});
  if (it == entities_.end()) return;

  for (const auto& key : keys) {
    it->second.erase(key);
  }
  if (it->second.empty()) entities_.erase(it);
  BumpLocked(type);
}

void FakeApplicator::RemoveAllLabels(EntityType type, const std::string& id) {
  std::lock_guard lock(mutex_);
  if (entities_.erase({type, id}) > 0) BumpLocked(type);
}

std::vector<Labeled> FakeApplicator::GetMatches(const Selector& selector, EntityType type) {
  std::lock_guard      lock(mutex_);
  std::vector<Labeled> matches;
  for (const auto& [key, labels] : entities_) {
    if (key.first != type || !selector.Matches(labels)) continue;
    matches.push_back({type, key.second, labels});
  }
  return matches;
}

std::vector<Labeled> FakeApplicator::All() {
  std::lock_guard      lock(mutex_);
  std::vector<Labeled> all;
  for (const auto& [key, labels] : entities_) {
    all.push_back({key.first, key.second, labels});
  }
  return all;
}

uint64_t FakeApplicator::WaitForChange(EntityType type, uint64_t after, std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  changed_.wait_for(lock, timeout, [&] { return versions_[type] != after; });
  return versions_[type];
}

} // namespace orchestrator::labels
