#include "fake_store.hpp"

#include "internal/util/errors.hpp"

namespace orchestrator::rcstore {

RC& FakeStore::FindLocked(const std::string& id) {
  auto it = records_.find(id);
  if (it == records_.end()) {
    throw util::NotFound("replication controller " + id + " not found");
  }
  return it->second;
}

void FakeStore::BumpLocked(const std::string& id) {
  versions_[id] = ++clock_;
  changed_.notify_all();
}

RC FakeStore::Create(const orchestrator::v1::PodManifest& manifest, const std::string& node_selector, const labels::Labels& pod_labels) {
  auto record = NewRecord(manifest, node_selector, pod_labels);

  std::lock_guard lock(mutex_);
  records_[record.id()] = record;
  BumpLocked(record.id());
  return record;
}

RC FakeStore::Get(const std::string& id) {
  std::lock_guard lock(mutex_);
  return FindLocked(id);
}

std::vector<RC> FakeStore::List() {
  std::lock_guard lock(mutex_);
  std::vector<RC> out;
  out.reserve(records_.size());
  for (const auto& [id, record] : records_) {
    out.push_back(record);
  }
  return out;
}

void FakeStore::SetDesiredReplicas(const std::string& id, int replicas) {
  ValidateReplicas(replicas);

  std::lock_guard lock(mutex_);
  FindLocked(id).set_replicas_desired(replicas);
  BumpLocked(id);
}

void FakeStore::Disable(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto&           record = FindLocked(id);
  if (record.disabled()) return;
  record.set_disabled(true);
  BumpLocked(id);
}

void FakeStore::Delete(const std::string& id) {
  std::lock_guard lock(mutex_);
  const auto&     record = FindLocked(id);
  if (record.replicas_desired() > 0) {
    throw util::Conflict("replication controller " + id + " still wants " + std::to_string(record.replicas_desired()) + " replicas");
  }
  records_.erase(id);
  BumpLocked(id);
}

uint64_t FakeStore::VersionLocked(const std::string& id) const {
  auto it = versions_.find(id);
  return it == versions_.end() ? 0 : it->second;
}

uint64_t FakeStore::WaitForChange(const std::string& id, uint64_t after, std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  changed_.wait_for(lock, timeout, [&] { return VersionLocked(id) > after; });
  return VersionLocked(id);
}

size_t FakeStore::TrackedVersions() {
  std::lock_guard lock(mutex_);
  return versions_.size();
}

} // namespace orchestrator::rcstore
