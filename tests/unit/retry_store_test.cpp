#include "internal/kv/retry.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/kv/memory/memory_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using orchestrator::kv::ErrorCode;
using orchestrator::kv::KVPair;
using orchestrator::kv::Result;
using orchestrator::kv::RetryingStore;
using orchestrator::kv::RetryPolicy;
using orchestrator::kv::memory::MemoryStore;

// Fails the next `failures` calls, then delegates.
class FlakyStore final : public orchestrator::kv::Store {
 public:
  explicit FlakyStore(int failures, ErrorCode code = ErrorCode::Unavailable) : failures_(failures), code_(code) {
  }

  int calls = 0;

  std::optional<KVPair> Get(const std::string& key) override {
    ++calls;
    if (failures_ > 0) {
      --failures_;
      throw orchestrator::util::StoreUnavailable("backend down");
    }
    return inner_.Get(key);
  }
  std::vector<KVPair> List(const std::string& prefix) override {
    return inner_.List(prefix);
  }
  uint64_t WaitIndex(const std::string& prefix, uint64_t after_index, std::chrono::milliseconds timeout) override {
    return inner_.WaitIndex(prefix, after_index, timeout);
  }

  Result Put(const KVPair& pair) override {
    ++calls;
    if (failures_ > 0) {
      --failures_;
      return Result::Err(code_, "backend down");
    }
    return inner_.Put(pair);
  }
  Result CheckAndSet(const KVPair& pair) override {
    return inner_.CheckAndSet(pair);
  }
  Result Delete(const std::string& key) override {
    return inner_.Delete(key);
  }
  Result DeleteCheckAndSet(const std::string& key, uint64_t modify_index) override {
    return inner_.DeleteCheckAndSet(key, modify_index);
  }
  std::string CreateSession(const std::string& name, std::chrono::milliseconds ttl) override {
    return inner_.CreateSession(name, ttl);
  }
  Result RenewSession(const std::string& session) override {
    return inner_.RenewSession(session);
  }
  Result DestroySession(const std::string& session) override {
    return inner_.DestroySession(session);
  }
  Result Acquire(const std::string& key, const std::string& session) override {
    return inner_.Acquire(key, session);
  }
  Result Release(const std::string& key, const std::string& session) override {
    return inner_.Release(key, session);
  }

 private:
  MemoryStore inner_;
  int         failures_;
  ErrorCode   code_;
};

RetryPolicy FastPolicy(uint32_t attempts) {
  RetryPolicy policy;
  policy.max_attempts = attempts;
  policy.backoff      = std::chrono::milliseconds(1);
  return policy;
}

KVPair Pair(const std::string& key) {
  KVPair pair;
  pair.key   = key;
  pair.value = "v";
  return pair;
}

void TestTransientWriteSucceedsWithinBudget() {
  auto          flaky = std::make_shared<FlakyStore>(2);
  RetryingStore store(flaky, FastPolicy(3));

  assert(store.Put(Pair("k")));
  assert(flaky->calls == 3);
}

void TestTransientWriteSurfacesAfterBudget() {
  auto          flaky = std::make_shared<FlakyStore>(5);
  RetryingStore store(flaky, FastPolicy(3));

  const auto result = store.Put(Pair("k"));
  assert(result.code == ErrorCode::Unavailable);
  assert(flaky->calls == 3);
}

void TestPermanentErrorIsNotRetried() {
  auto          flaky = std::make_shared<FlakyStore>(5, ErrorCode::InvalidArgument);
  RetryingStore store(flaky, FastPolicy(3));

  assert(store.Put(Pair("k")).code == ErrorCode::InvalidArgument);
  assert(flaky->calls == 1);
}

void TestReadRetriesThenThrows() {
  auto          recovering = std::make_shared<FlakyStore>(1);
  RetryingStore ok(recovering, FastPolicy(2));
  assert(!ok.Get("missing"));
  assert(recovering->calls == 2);

  auto          down = std::make_shared<FlakyStore>(10);
  RetryingStore failing(down, FastPolicy(2));
  bool          threw = false;
  try {
    failing.Get("missing");
  } catch (const orchestrator::util::StoreUnavailable&) {
    threw = true;
  }
  assert(threw);
  assert(down->calls == 2);
}

} // namespace

int main() {
  TestTransientWriteSucceedsWithinBudget();
  TestTransientWriteSurfacesAfterBudget();
  TestPermanentErrorIsNotRetried();
  TestReadRetriesThenThrows();

  std::cout << "orchestrator_unit_retry_store: pass\n";
  return 0;
}
