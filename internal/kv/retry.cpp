#include "retry.hpp"

#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace orchestrator::kv {

bool IsTransient(ErrorCode code) {
  return code == ErrorCode::Unavailable;
}

RetryingStore::RetryingStore(std::shared_ptr<Store> inner, RetryPolicy policy) : inner_(std::move(inner)), policy_(std::move(policy)) {
  if (policy_.max_attempts == 0) policy_.max_attempts = 1;
  if (!policy_.is_transient) policy_.is_transient = IsTransient;
}

void RetryingStore::Backoff(uint32_t attempt) const {
  if (policy_.backoff.count() > 0) {
    std::this_thread::sleep_for(policy_.backoff * attempt);
  }
}

Result RetryingStore::RetryWrite(const char* op, const std::function<Result()>& fn) {
  Result result;
  for (uint32_t attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
    result = fn();
    if (result || !policy_.is_transient(result.code)) {
      return result;
    }

    ORCHESTRATOR_LOG_WARN("coordination store write failed",
                          {observability::StringField("op", op), observability::IntField("attempt", attempt),
                           observability::IntField("max_attempts", policy_.max_attempts), observability::StringField("error", result.message)});
    if (attempt < policy_.max_attempts) Backoff(attempt);
  }
  return result;
}

template <typename Fn>
auto RetryingStore::RetryRead(const char* op, Fn&& fn) -> decltype(fn()) {
  for (uint32_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const util::StoreUnavailable& e) {
      if (!policy_.is_transient(ErrorCode::Unavailable) || attempt >= policy_.max_attempts) {
        throw;
      }
      ORCHESTRATOR_LOG_WARN("coordination store read failed",
                            {observability::StringField("op", op), observability::IntField("attempt", attempt),
                             observability::IntField("max_attempts", policy_.max_attempts), observability::StringField("error", e.what())});
      Backoff(attempt);
    }
  }
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::optional<KVPair> RetryingStore::Get(const std::string& key) {
  return RetryRead("get", [&] { return inner_->Get(key); });
}

std::vector<KVPair> RetryingStore::List(const std::string& prefix) {
  return RetryRead("list", [&] { return inner_->List(prefix); });
}

uint64_t RetryingStore::WaitIndex(const std::string& prefix, uint64_t after_index, std::chrono::milliseconds timeout) {
  return RetryRead("watch", [&] { return inner_->WaitIndex(prefix, after_index, timeout); });
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

Result RetryingStore::Put(const KVPair& pair) {
  return RetryWrite("put", [&] { return inner_->Put(pair); });
}

Result RetryingStore::CheckAndSet(const KVPair& pair) {
  return RetryWrite("cas", [&] { return inner_->CheckAndSet(pair); });
}

Result RetryingStore::Delete(const std::string& key) {
  return RetryWrite("delete", [&] { return inner_->Delete(key); });
}

Result RetryingStore::DeleteCheckAndSet(const std::string& key, uint64_t modify_index) {
  return RetryWrite("delete-cas", [&] { return inner_->DeleteCheckAndSet(key, modify_index); });
}

// ------------------------------------------------------------
// Sessions and locks
// ------------------------------------------------------------

std::string RetryingStore::CreateSession(const std::string& name, std::chrono::milliseconds ttl) {
  return RetryRead("create-session", [&] { return inner_->CreateSession(name, ttl); });
}

Result RetryingStore::RenewSession(const std::string& session) {
  return RetryWrite("renew-session", [&] { return inner_->RenewSession(session); });
}

Result RetryingStore::DestroySession(const std::string& session) {
  return RetryWrite("destroy-session", [&] { return inner_->DestroySession(session); });
}

Result RetryingStore::Acquire(const std::string& key, const std::string& session) {
  return RetryWrite("acquire", [&] { return inner_->Acquire(key, session); });
}

Result RetryingStore::Release(const std::string& key, const std::string& session) {
  return RetryWrite("release", [&] { return inner_->Release(key, session); });
}

} // namespace orchestrator::kv
