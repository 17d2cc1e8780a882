#include "factory.hpp"

#include <chrono>

#include "internal/kv/memory/memory_store.hpp"
#include "internal/kv/retry.hpp"
#include "internal/kv/sqlite/sqlite_db.hpp"
#include "internal/kv/sqlite/sqlite_store.hpp"
#include "internal/labels/http_applicator.hpp"
#include "internal/labels/kv_applicator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/rcstore/kv_store.hpp"

namespace orchestrator::factory {

using namespace orchestrator::runtime::config;
using std::chrono::milliseconds;

std::shared_ptr<kv::Store> BuildStore(const StoreConfig& config) {
  std::shared_ptr<kv::Store> backend;

  if (config.has_sqlite()) {
    auto db     = std::make_shared<kv::sqlite::SqliteDB>(config.sqlite().path());
    auto sqlite = std::make_shared<kv::sqlite::SqliteStore>(std::move(db));
    sqlite->Bootstrap();
    backend = std::move(sqlite);
    ORCHESTRATOR_LOG_INFO("coordination store opened", {observability::StringField("backend", "sqlite"), observability::StringField("path", config.sqlite().path())});
  } else {
    backend = std::make_shared<kv::memory::MemoryStore>();
    ORCHESTRATOR_LOG_INFO("coordination store opened", {observability::StringField("backend", "memory")});
  }

  kv::RetryPolicy policy;
  if (config.retry_attempts() > 0) policy.max_attempts = config.retry_attempts();
  policy.backoff = milliseconds(config.retry_backoff_ms());
  return std::make_shared<kv::RetryingStore>(std::move(backend), std::move(policy));
}

rc::ControllerOptions ControllerOptionsFrom(const RuntimeConfig& config) {
  rc::ControllerOptions options;
  options.fallback_tick = milliseconds(config.reconcile().fallback_tick_ms());
  options.watch_slice   = milliseconds(config.reconcile().watch_slice_ms());
  options.session_ttl   = milliseconds(config.store().session_ttl_ms());
  return options;
}

Runtime BuildRuntime(const RuntimeConfig& config) {
  Runtime rt;

  // ------------------------------------------------------------------
  // Coordination store
  // ------------------------------------------------------------------
  rt.store = BuildStore(config.store());
  rt.pods  = std::make_shared<kp::PodStore>(rt.store);

  const auto retries = static_cast<int>(config.store().retry_attempts());
  rt.labels          = std::make_shared<labels::KvApplicator>(rt.store, retries);
  rt.labels->SetWatchSlice(milliseconds(config.reconcile().watch_slice_ms()));

  // ------------------------------------------------------------------
  // Scheduling
  // ------------------------------------------------------------------
  const auto& scheduler = config.scheduler();
  if (scheduler.has_http()) {
    labels::HttpApplicatorOptions options;
    options.endpoint = scheduler.http().endpoint();
    options.headers.insert(scheduler.http().headers().begin(), scheduler.http().headers().end());
    options.timeout = milliseconds(scheduler.http().timeout_ms());
    rt.nodes        = std::make_shared<labels::HttpApplicator>(std::move(options));
  } else {
    rt.nodes = rt.labels;
  }
  rt.scheduler = std::make_shared<rc::ApplicatorScheduler>(rt.nodes);

  // ------------------------------------------------------------------
  // Replication controllers
  // ------------------------------------------------------------------
  rt.rcs     = std::make_shared<rcstore::KvStore>(rt.store, rt.labels);
  rt.tracker = std::make_shared<status::Tracker>();

  rc::FarmOptions farm;
  farm.poll_interval = milliseconds(config.reconcile().farm_poll_ms());
  farm.session_ttl   = milliseconds(config.store().session_ttl_ms());
  farm.controller    = ControllerOptionsFrom(config);
  rt.farm            = std::make_shared<rc::Farm>(rt.store, rt.pods, rt.rcs, rt.scheduler, rt.labels, rt.tracker, std::move(farm));

  return rt;
}

} // namespace orchestrator::factory
