#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/labels/applicator.hpp"

namespace orchestrator::rc {

/*
  Resolves a node selector to eligible nodes.

  The order must be stable for a given selector and label state so replica
  placement does not move between ticks. Failures are util::SchedulingError.
*/
class Scheduler {
 public:
  virtual ~Scheduler() = default;

  virtual std::vector<std::string> EligibleNodes(const labels::Selector& selector) = 0;

  // Parses first; a malformed expression is a SchedulingError too.
  std::vector<std::string> EligibleNodes(const std::string& selector);
};

// Node entities matching the selector, sorted by name.
class ApplicatorScheduler final : public Scheduler {
 public:
  explicit ApplicatorScheduler(std::shared_ptr<labels::Applicator> applicator);

  using Scheduler::EligibleNodes;
  std::vector<std::string> EligibleNodes(const labels::Selector& selector) override;

 private:
  std::shared_ptr<labels::Applicator> applicator_;
};

} // namespace orchestrator::rc
