#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/kv/api/result.hpp"
#include "internal/kv/api/types.hpp"

namespace orchestrator::kv {

/*
  Coordination store abstraction.

  CRITICAL GUARANTEES (all backends):

  - Every write bumps a single store-wide index and stamps the key with it
  - CheckAndSet / DeleteCheckAndSet are atomic per key
  - WaitIndex observes deletes as well as writes under the prefix
  - A lock key held by a live session cannot be acquired by another session
  - Destroying (or letting expire) a session releases every lock it holds

  Reads throw util::StoreUnavailable when the backend cannot be reached.
  Writes report failures through Result and never throw for store errors.
*/
class Store {
 public:
  virtual ~Store() = default;

  // ---------------------------------------------------------------------
  // Reads
  // ---------------------------------------------------------------------

  virtual std::optional<KVPair> Get(const std::string& key) = 0;

  // Sorted by key.
  virtual std::vector<KVPair> List(const std::string& prefix) = 0;

  // Blocks until a key under prefix changes past after_index or the timeout
  // passes. Returns the current index of the prefix.
  virtual uint64_t WaitIndex(const std::string& prefix, uint64_t after_index, std::chrono::milliseconds timeout) = 0;

  // ---------------------------------------------------------------------
  // Writes
  // ---------------------------------------------------------------------

  virtual Result Put(const KVPair& pair) = 0;

  // pair.modify_index == 0: create only if the key is absent.
  // Otherwise write only if the stored modify_index still matches.
  virtual Result CheckAndSet(const KVPair& pair) = 0;

  virtual Result Delete(const std::string& key) = 0;

  virtual Result DeleteCheckAndSet(const std::string& key, uint64_t modify_index) = 0;

  // ---------------------------------------------------------------------
  // Sessions and locks
  // ---------------------------------------------------------------------

  virtual std::string CreateSession(const std::string& name, std::chrono::milliseconds ttl) = 0;

  virtual Result RenewSession(const std::string& session) = 0;

  virtual Result DestroySession(const std::string& session) = 0;

  virtual Result Acquire(const std::string& key, const std::string& session) = 0;

  virtual Result Release(const std::string& key, const std::string& session) = 0;
};

} // namespace orchestrator::kv
