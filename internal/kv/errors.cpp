#include "errors.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace orchestrator::kv {

void ThrowIfError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::Conflict:
      throw util::Conflict(message);
    case ErrorCode::Unavailable:
      throw util::StoreUnavailable(message);
    case ErrorCode::InvalidArgument:
      throw util::InvalidArgument(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace orchestrator::kv
