#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include "internal/kv/api/store.hpp"

namespace orchestrator::kv {

bool IsTransient(ErrorCode code);

/*
  How many times a store call is attempted and which failures count as
  transient. NotFound / Conflict / InvalidArgument are never retried by the
  default classifier.
*/
struct RetryPolicy {
  uint32_t                       max_attempts = 3;
  std::chrono::milliseconds      backoff{25};
  std::function<bool(ErrorCode)> is_transient = IsTransient;
};

/*
  Decorator that retries transient failures of the wrapped store.

  Write failures are classified by their Result code; read failures by
  util::StoreUnavailable. Once the budget is spent the last failure is
  surfaced unchanged.
*/
class RetryingStore final : public Store {
 public:
  RetryingStore(std::shared_ptr<Store> inner, RetryPolicy policy = {});

  const RetryPolicy& Policy() const {
    return policy_;
  }

  std::optional<KVPair> Get(const std::string& key) override;
  std::vector<KVPair>   List(const std::string& prefix) override;
  uint64_t              WaitIndex(const std::string& prefix, uint64_t after_index, std::chrono::milliseconds timeout) override;

  Result Put(const KVPair& pair) override;
  Result CheckAndSet(const KVPair& pair) override;
  Result Delete(const std::string& key) override;
  Result DeleteCheckAndSet(const std::string& key, uint64_t modify_index) override;

  std::string CreateSession(const std::string& name, std::chrono::milliseconds ttl) override;
  Result      RenewSession(const std::string& session) override;
  Result      DestroySession(const std::string& session) override;
  Result      Acquire(const std::string& key, const std::string& session) override;
  Result      Release(const std::string& key, const std::string& session) override;

 private:
  Result RetryWrite(const char* op, const std::function<Result()>& fn);

  template <typename Fn>
  auto RetryRead(const char* op, Fn&& fn) -> decltype(fn());

  void Backoff(uint32_t attempt) const;

  std::shared_ptr<Store> inner_;
  RetryPolicy            policy_;
};

} // namespace orchestrator::kv
