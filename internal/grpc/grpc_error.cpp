#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace orchestrator::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace orchestrator::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const Conflict*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const StoreUnavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const Unsupported*>(&e)) {
    return {::grpc::StatusCode::UNIMPLEMENTED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace orchestrator::grpc
