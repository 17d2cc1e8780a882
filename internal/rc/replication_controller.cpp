#include "replication_controller.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

#include "internal/kp/paths.hpp"
#include "internal/kv/errors.hpp"
#include "internal/kv/lock_guard.hpp"
#include "internal/observability/logging.hpp"
#include "internal/rc/ownership.hpp"

namespace orchestrator::rc {

using observability::IntField;
using observability::StringField;

const char* WatchErrorKindName(WatchError::Kind kind) {
  switch (kind) {
    case WatchError::Kind::Record:
      return "record";
    case WatchError::Kind::Scheduling:
      return "scheduling";
    case WatchError::Kind::Listing:
      return "listing";
    case WatchError::Kind::Placement:
      return "placement";
    case WatchError::Kind::Removal:
      return "removal";
  }
  return "unknown";
}

std::string WatchError::String() const {
  std::string out = WatchErrorKindName(kind);
  if (!node.empty()) out += " on node " + node;
  return out + ": " + message;
}

ReplicationController::ReplicationController(rcstore::RC                         record,
                                             std::shared_ptr<kp::PodStore>       pods,
                                             std::shared_ptr<rcstore::Store>     rcs,
                                             std::shared_ptr<Scheduler>          scheduler,
                                             std::shared_ptr<labels::Applicator> applicator,
                                             ControllerOptions                   options)
    : id_(record.id()),
      pods_(std::move(pods)),
      rcs_(std::move(rcs)),
      scheduler_(std::move(scheduler)),
      applicator_(std::move(applicator)),
      options_(std::move(options)),
      record_(std::move(record)),
      successes_(std::make_shared<TickChannel>(64)) {
  if (options_.watch_slice.count() <= 0) options_.watch_slice = std::chrono::milliseconds(250);
  if (options_.fallback_tick.count() <= 0) options_.fallback_tick = std::chrono::milliseconds(1000);
}

ReplicationController::~ReplicationController() {
  if (thread_.joinable()) {
    quit_->Request();
    thread_.join();
  }
}

rcstore::RC ReplicationController::Record() const {
  std::lock_guard lock(mutex_);
  return record_;
}

std::shared_ptr<ReplicationController::ErrorChannel> ReplicationController::WatchDesires(std::shared_ptr<runtime::QuitSignal> quit) {
  if (started_.exchange(true)) {
    throw std::logic_error("watch loop for " + id_ + " already started");
  }

  auto errors = std::make_shared<ErrorChannel>(256);
  quit_       = std::move(quit);
  thread_     = std::thread(&ReplicationController::Run, this, quit_, errors);
  return errors;
}

void ReplicationController::Run(std::shared_ptr<runtime::QuitSignal> quit, std::shared_ptr<ErrorChannel> errors) {
  ORCHESTRATOR_LOG_INFO("watching replication controller", {StringField("rc", id_)});

  uint64_t token = 0;
  try {
    token = rcs_->WaitForChange(id_, 0, std::chrono::milliseconds(0));
  } catch (const std::exception& e) {
    Report(*errors, {WatchError::Kind::Record, {}, e.what()});
  }

  while (!quit->IsRequested()) {
    Tick(*errors);

    const auto deadline = std::chrono::steady_clock::now() + options_.fallback_tick;
    while (!quit->IsRequested()) {
      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) break;

      const auto slice = std::min(remaining, options_.watch_slice);
      try {
        const auto next = rcs_->WaitForChange(id_, token, slice);
        if (next != token) {
          token = next;
          break;
        }
      } catch (const std::exception& e) {
        ORCHESTRATOR_LOG_WARN("record watch failed", {StringField("rc", id_), StringField("error", e.what())});
        quit->WaitFor(slice);
      }
    }
  }

  if (!own_session_.empty()) {
    const auto result = pods_->Store()->DestroySession(own_session_);
    if (!result) {
      ORCHESTRATOR_LOG_WARN("destroy lock session failed", {StringField("rc", id_), StringField("error", result.message)});
    }
  }

  errors->Close();
  successes_->Close();
  ORCHESTRATOR_LOG_INFO("replication controller watch stopped", {StringField("rc", id_), IntField("ticks", static_cast<int64_t>(ticks_))});
  quit->Acknowledge();
}

void ReplicationController::Report(ErrorChannel& errors, WatchError error) {
  error.tick = ticks_;
  ORCHESTRATOR_LOG_WARN("replication controller error",
                        {StringField("rc", id_), StringField("kind", WatchErrorKindName(error.kind)), StringField("node", error.node),
                         StringField("error", error.message)});
  errors.Send(std::move(error));
}

bool ReplicationController::Tick(ErrorChannel& errors) {
  ++ticks_;

  rcstore::RC record;
  try {
    record = rcs_->Get(id_);
  } catch (const std::exception& e) {
    Report(errors, {WatchError::Kind::Record, {}, e.what()});
    return false;
  }

  {
    std::lock_guard lock(mutex_);
    record_ = record;
  }

  if (record.disabled()) {
    successes_->Send({ticks_, {}});
    return true;
  }

  bool ok = true;

  std::vector<std::string> eligible;
  try {
    eligible = scheduler_->EligibleNodes(record.node_selector());
  } catch (const std::exception& e) {
    Report(errors, {WatchError::Kind::Scheduling, {}, e.what()});
    return false;
  }

  const auto desired = static_cast<size_t>(std::max(0, record.replicas_desired()));
  if (eligible.size() < desired) {
    Report(errors, {WatchError::Kind::Scheduling, {},
                    "wanted " + std::to_string(desired) + " nodes for \"" + record.node_selector() + "\", only " + std::to_string(eligible.size()) +
                        " eligible"});
    ok = false;
  }
  const std::set<std::string> target(eligible.begin(), eligible.begin() + std::min(desired, eligible.size()));

  std::vector<std::pair<std::string, std::string>> owned;
  try {
    owned = OwnedPods();
  } catch (const std::exception& e) {
    Report(errors, {WatchError::Kind::Listing, {}, e.what()});
    return false;
  }

  std::set<std::string> current;
  for (const auto& [node, entity] : owned) {
    current.insert(node);
  }

  for (const auto& node : target) {
    if (current.count(node)) continue;
    try {
      Place(record, node);
    } catch (const std::exception& e) {
      Report(errors, {WatchError::Kind::Placement, node, e.what()});
      ok = false;
    }
  }

  for (const auto& [node, entity] : owned) {
    if (target.count(node)) continue;
    try {
      Remove(node, entity);
    } catch (const std::exception& e) {
      Report(errors, {WatchError::Kind::Removal, node, e.what()});
      ok = false;
    }
  }

  if (ok) {
    successes_->Send({ticks_, std::vector<std::string>(target.begin(), target.end())});
  }
  return ok;
}

void ReplicationController::Place(const rcstore::RC& record, const std::string& node) {
  const auto& manifest = record.manifest();
  pods_->SetPod(kp::Tree::Intent, node, manifest);

  labels::Labels pod_labels(record.pod_labels().begin(), record.pod_labels().end());
  pod_labels[kOwnerLabel] = id_;
  applicator_->SetLabels(labels::EntityType::Pod, PodEntityId(node, manifest.id()), pod_labels);

  ORCHESTRATOR_LOG_INFO("pod scheduled", {StringField("rc", id_), StringField("node", node), StringField("pod", manifest.id())});
}

void ReplicationController::Remove(const std::string& node, const std::string& entity_id) {
  const auto pod_id = entity_id.substr(node.size() + 1);

  kv::LockGuard guard(pods_->Store(), kp::PodLockPath(kp::Tree::Intent, node, pod_id), LockSession());
  pods_->DeletePod(kp::Tree::Intent, node, pod_id);
  applicator_->RemoveAllLabels(labels::EntityType::Pod, entity_id);
  guard.Release();

  ORCHESTRATOR_LOG_INFO("pod unscheduled", {StringField("rc", id_), StringField("node", node), StringField("pod", pod_id)});
}

const std::string& ReplicationController::LockSession() {
  if (!options_.lock_session.empty()) {
    return options_.lock_session;
  }

  if (!own_session_.empty()) {
    const auto result = pods_->Store()->RenewSession(own_session_);
    if (result) return own_session_;
    own_session_.clear();
  }
  own_session_ = pods_->Store()->CreateSession("rc/" + id_, options_.session_ttl);
  return own_session_;
}

std::vector<std::pair<std::string, std::string>> ReplicationController::OwnedPods() {
  std::vector<std::pair<std::string, std::string>> owned;
  for (const auto& pod : applicator_->GetMatches(OwnedBy(id_), labels::EntityType::Pod)) {
    auto node = NodeOfPodEntity(pod.id);
    if (node.empty()) continue;
    owned.emplace_back(std::move(node), pod.id);
  }
  std::sort(owned.begin(), owned.end());
  return owned;
}

std::vector<std::string> ReplicationController::CurrentNodes() {
  return OwnedNodes(*applicator_, id_);
}

bool ReplicationController::WaitForNodes(const std::function<bool(const std::vector<std::string>&)>& predicate,
                                         std::chrono::milliseconds                                   timeout,
                                         const runtime::QuitSignal*                                  cancel) {
  runtime::QuitSignal stop;
  bool                satisfied = false;

  std::thread timer([&] {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      if (cancel && cancel->IsRequested()) break;
      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
      if (stop.WaitFor(std::min(remaining, options_.watch_slice))) return;
    }
    stop.Request();
  });

  applicator_->WatchMatches(OwnedBy(id_), labels::EntityType::Pod, stop, [&](const std::vector<labels::Labeled>& pods) {
    if (predicate(NodesOf(pods))) {
      satisfied = true;
      stop.Request();
    }
  });

  stop.Request();
  timer.join();
  return satisfied;
}

} // namespace orchestrator::rc
