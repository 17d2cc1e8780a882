#pragma once

#include <memory>
#include <string>

#include "internal/kv/api/store.hpp"

namespace orchestrator::kv {

/*
  Holds one lock path for one session.

  The constructor acquires (throws util::Conflict when another session holds
  the path); destruction releases unless Release() was already called.
*/
class LockGuard {
 public:
  LockGuard(std::shared_ptr<Store> store, std::string key, std::string session);
  ~LockGuard();

  LockGuard(const LockGuard&)            = delete;
  LockGuard& operator=(const LockGuard&) = delete;

  // Releases now and reports failures instead of logging them.
  void Release();

  const std::string& Key() const {
    return key_;
  }

 private:
  std::shared_ptr<Store> store_;
  std::string            key_;
  std::string            session_;
  bool                   held_ = false;
};

} // namespace orchestrator::kv
