#include "farm.hpp"

#include <set>

#include "internal/kp/paths.hpp"
#include "internal/observability/logging.hpp"

namespace orchestrator::rc {

using observability::IntField;
using observability::StringField;

Farm::Farm(std::shared_ptr<kv::Store>          store,
           std::shared_ptr<kp::PodStore>       pods,
           std::shared_ptr<rcstore::Store>     rcs,
           std::shared_ptr<Scheduler>          scheduler,
           std::shared_ptr<labels::Applicator> applicator,
           std::shared_ptr<status::Tracker>    tracker,
           FarmOptions                         options)
    : store_(std::move(store)),
      pods_(std::move(pods)),
      rcs_(std::move(rcs)),
      scheduler_(std::move(scheduler)),
      applicator_(std::move(applicator)),
      tracker_(std::move(tracker)),
      options_(std::move(options)) {
}

Farm::~Farm() {
  try {
    Stop();
  } catch (const std::exception& e) {
    ORCHESTRATOR_LOG_ERROR("farm shutdown failed", {StringField("farm", options_.name), StringField("error", e.what())});
  }
}

void Farm::Start() {
  thread_ = std::thread(&Farm::Run, this);
}

void Farm::Run() {
  ORCHESTRATOR_LOG_INFO("rc farm started", {StringField("farm", options_.name), IntField("poll_ms", options_.poll_interval.count())});
  do {
    try {
      Sync();
    } catch (const std::exception& e) {
      ORCHESTRATOR_LOG_WARN("rc farm sync failed", {StringField("farm", options_.name), StringField("error", e.what())});
      tracker_->RecordError(options_.name, e.what());
    }
  } while (!quit_.WaitFor(options_.poll_interval));
}

void Farm::EnsureSession() {
  if (!session_.empty()) {
    const auto renewed = store_->RenewSession(session_);
    if (renewed) return;

    // every lock we held is gone with the session
    ORCHESTRATOR_LOG_WARN("farm session lost; restarting controllers", {StringField("farm", options_.name), StringField("error", renewed.message)});
    std::map<std::string, Child> orphans;
    {
      std::lock_guard lock(mutex_);
      orphans.swap(children_);
      session_.clear();
    }
    for (auto& [id, child] : orphans) {
      StopChild(id, child, false);
    }
  }

  auto session = store_->CreateSession(options_.name, options_.session_ttl);
  std::lock_guard lock(mutex_);
  session_ = std::move(session);
}

void Farm::Sync() {
  std::lock_guard sync(sync_mutex_);
  if (stopped_) return;

  const auto records = rcs_->List();
  EnsureSession();

  std::set<std::string> present;
  for (const auto& record : records) {
    present.insert(record.id());

    bool running = false;
    {
      std::lock_guard lock(mutex_);
      running = children_.count(record.id()) > 0;
    }
    if (!running) Claim(record);
  }

  std::map<std::string, Child> gone;
  {
    std::lock_guard lock(mutex_);
    for (auto it = children_.begin(); it != children_.end();) {
      if (present.count(it->first)) {
        ++it;
        continue;
      }
      gone.emplace(it->first, std::move(it->second));
      it = children_.erase(it);
    }
  }
  for (auto& [id, child] : gone) {
    ORCHESTRATOR_LOG_INFO("replication controller removed; stopping its loop", {StringField("farm", options_.name), StringField("rc", id)});
    StopChild(id, child, true);
  }

  tracker_->RecordSuccess(options_.name);
}

void Farm::Claim(const rcstore::RC& record) {
  const auto lock_path = kp::ReplicationControllerLockPath(record.id());
  const auto acquired  = store_->Acquire(lock_path, session_);
  if (!acquired) {
    if (acquired.code != kv::ErrorCode::Conflict) {
      ORCHESTRATOR_LOG_WARN("claim failed", {StringField("farm", options_.name), StringField("rc", record.id()), StringField("error", acquired.message)});
    }
    return;
  }

  auto options         = options_.controller;
  options.lock_session = session_;

  Child child;
  child.controller = std::make_shared<ReplicationController>(record, pods_, rcs_, scheduler_, applicator_, options);
  child.quit       = std::make_shared<runtime::QuitSignal>();
  auto errors      = child.controller->WatchDesires(child.quit);
  child.pump       = std::make_unique<StatusPump>(LoopName(record.id()), errors, child.controller->Successes(), tracker_);

  ORCHESTRATOR_LOG_INFO("replication controller claimed", {StringField("farm", options_.name), StringField("rc", record.id())});

  std::lock_guard lock(mutex_);
  children_.emplace(record.id(), std::move(child));
}

void Farm::StopChild(const std::string& id, Child& child, bool release_lock) {
  child.quit->RequestAndWait();
  child.pump->Join();
  child.controller.reset();
  tracker_->Forget(LoopName(id));

  if (!release_lock) return;

  const auto released = store_->Release(kp::ReplicationControllerLockPath(id), session_);
  if (!released) {
    ORCHESTRATOR_LOG_WARN("release claim failed", {StringField("farm", options_.name), StringField("rc", id), StringField("error", released.message)});
  }
}

void Farm::Stop() {
  if (thread_.joinable()) {
    quit_.Request();
    thread_.join();
  }

  std::lock_guard sync(sync_mutex_);
  if (stopped_) return;
  stopped_ = true;

  std::map<std::string, Child> children;
  {
    std::lock_guard lock(mutex_);
    children.swap(children_);
  }
  for (auto& [id, child] : children) {
    StopChild(id, child, true);
  }

  if (!session_.empty()) {
    const auto destroyed = store_->DestroySession(session_);
    if (!destroyed) {
      ORCHESTRATOR_LOG_WARN("destroy farm session failed", {StringField("farm", options_.name), StringField("error", destroyed.message)});
    }
  }
  ORCHESTRATOR_LOG_INFO("rc farm stopped", {StringField("farm", options_.name), IntField("controllers", static_cast<int64_t>(children.size()))});
}

std::vector<std::string> Farm::Running() const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> ids;
  for (const auto& [id, child] : children_) {
    ids.push_back(id);
  }
  return ids;
}

std::shared_ptr<ReplicationController> Farm::Controller(const std::string& id) const {
  std::lock_guard lock(mutex_);
  auto            it = children_.find(id);
  if (it == children_.end()) return nullptr;
  return it->second.controller;
}

} // namespace orchestrator::rc
