#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/kp/pod_store.hpp"
#include "internal/kv/api/store.hpp"
#include "internal/labels/applicator.hpp"
#include "internal/rc/farm.hpp"
#include "internal/rc/scheduler.hpp"
#include "internal/rcstore/store.hpp"
#include "internal/status/tracker.hpp"

namespace orchestrator::factory {

/*
  Runtime

  Owns all long-lived components of an rc-manager process.
*/
struct Runtime {
  std::shared_ptr<kv::Store>          store; // wrapped in the retry decorator
  std::shared_ptr<kp::PodStore>       pods;
  std::shared_ptr<labels::Applicator> labels; // pod and RC entities
  std::shared_ptr<labels::Applicator> nodes;  // scheduler's node source
  std::shared_ptr<rc::Scheduler>      scheduler;
  std::shared_ptr<rcstore::Store>     rcs;
  std::shared_ptr<status::Tracker>    tracker;
  std::shared_ptr<rc::Farm>           farm;
};

/*
  Concrete coordination store for the config, retry decorator included.

  NOTE:
  This is the ONLY place allowed to know concrete store types.
*/
std::shared_ptr<kv::Store> BuildStore(const orchestrator::runtime::config::StoreConfig& config);

rc::ControllerOptions ControllerOptionsFrom(const orchestrator::runtime::config::RuntimeConfig& config);

// Composition root. The farm is built but not started.
Runtime BuildRuntime(const orchestrator::runtime::config::RuntimeConfig& config);

} // namespace orchestrator::factory
