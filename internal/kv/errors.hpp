#pragma once

#include <string>

#include "internal/kv/api/result.hpp"

namespace orchestrator::kv {

// Translates a failed store Result into the matching util:: exception.
void ThrowIfError(const Result& result, const std::string& context);

} // namespace orchestrator::kv
