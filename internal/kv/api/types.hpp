#pragma once

#include <cstdint>
#include <string>

namespace orchestrator::kv {

/*
  One key in the coordination store.

  modify_index is assigned by the store on every write from a single
  store-wide counter, so it is both a version for check-and-set and a
  position for watches.
*/
struct KVPair {
  std::string key;
  std::string value;

  uint64_t create_index = 0;
  uint64_t modify_index = 0;

  // id of the session holding this key as a lock, empty if unlocked
  std::string session;
};

} // namespace orchestrator::kv
