#pragma once

#include <stdexcept>
#include <string>

namespace orchestrator::util {

/*
  Central error types.

  Lower layers (kv) report with result codes; everything above translates
  those into these exceptions. The gRPC adapters map them to status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Precondition failures such as deleting an RC that still wants replicas,
// or losing a check-and-set race.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Rejected before any store interaction.
class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transient coordination store failure that survived the retry budget.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SchedulingError : public std::runtime_error {
 public:
  explicit SchedulingError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unsupported : public std::runtime_error {
 public:
  explicit Unsupported(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace orchestrator::util
