#pragma once

#include <memory>

namespace orchestrator::rcstore {
class Store;
}
namespace orchestrator::labels {
class Applicator;
}
namespace orchestrator::status {
class Tracker;
}

namespace orchestrator::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<orchestrator::rcstore::Store>      rcs;
  std::shared_ptr<orchestrator::labels::Applicator> applicator;
  std::shared_ptr<orchestrator::status::Tracker>     tracker;
};

} // namespace orchestrator::service
