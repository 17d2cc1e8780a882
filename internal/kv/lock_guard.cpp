#include "lock_guard.hpp"

#include "internal/kv/errors.hpp"
#include "internal/observability/logging.hpp"

namespace orchestrator::kv {

LockGuard::LockGuard(std::shared_ptr<Store> store, std::string key, std::string session)
    : store_(std::move(store)), key_(std::move(key)), session_(std::move(session)) {
  ThrowIfError(store_->Acquire(key_, session_), "acquire " + key_);
  held_ = true;
}

LockGuard::~LockGuard() {
  if (!held_) return;

  const auto result = store_->Release(key_, session_);
  if (!result) {
    ORCHESTRATOR_LOG_WARN("lock release failed",
                          {observability::StringField("key", key_), observability::StringField("session", session_),
                           observability::StringField("error", result.message)});
  }
}

void LockGuard::Release() {
  if (!held_) return;
  held_ = false;
  ThrowIfError(store_->Release(key_, session_), "release " + key_);
}

} // namespace orchestrator::kv
