#include "scheduler.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace orchestrator::rc {

std::vector<std::string> Scheduler::EligibleNodes(const std::string& selector) {
  labels::Selector parsed;
  try {
    parsed = labels::Selector::Parse(selector);
  } catch (const util::InvalidArgument& e) {
    throw util::SchedulingError(e.what());
  }
  return EligibleNodes(parsed);
}

ApplicatorScheduler::ApplicatorScheduler(std::shared_ptr<labels::Applicator> applicator) : applicator_(std::move(applicator)) {
}

std::vector<std::string> ApplicatorScheduler::EligibleNodes(const labels::Selector& selector) {
  std::vector<labels::Labeled> matches;
  try {
    matches = applicator_->GetMatches(selector, labels::EntityType::Node);
  } catch (const util::SchedulingError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::SchedulingError("resolve nodes for \"" + selector.String() + "\": " + e.what());
  }

  std::vector<std::string> nodes;
  nodes.reserve(matches.size());
  for (const auto& match : matches) {
    nodes.push_back(match.id);
  }
  std::sort(nodes.begin(), nodes.end());
  nodes.erase(std::unique(nodes.begin(), nodes.end()), nodes.end());
  return nodes;
}

} // namespace orchestrator::rc
