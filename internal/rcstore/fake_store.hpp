#pragma once

#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>

#include "internal/rcstore/store.hpp"

namespace orchestrator::rcstore {

/*
  In-memory RC store. Same contracts as KvStore, no labels.
*/
class FakeStore final : public Store {
 public:
  RC Create(const orchestrator::v1::PodManifest& manifest, const std::string& node_selector, const labels::Labels& pod_labels) override;

  RC              Get(const std::string& id) override;
  std::vector<RC> List() override;

  void SetDesiredReplicas(const std::string& id, int replicas) override;
  void Disable(const std::string& id) override;
  void Delete(const std::string& id) override;

  uint64_t WaitForChange(const std::string& id, uint64_t after, std::chrono::milliseconds timeout) override;

  // ids ever written; waiting on an unknown id adds nothing
  size_t TrackedVersions();

 private:
  RC&      FindLocked(const std::string& id);
  void     BumpLocked(const std::string& id);
  uint64_t VersionLocked(const std::string& id) const;

  std::mutex              mutex_;
  std::condition_variable changed_;

  std::map<std::string, RC>       records_;
  std::map<std::string, uint64_t> versions_;
  uint64_t                        clock_ = 0;
};

} // namespace orchestrator::rcstore
