#include "internal/kv/memory/memory_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace {

using orchestrator::kv::ErrorCode;
using orchestrator::kv::KVPair;
using orchestrator::kv::memory::MemoryStore;

KVPair Pair(const std::string& key, const std::string& value, uint64_t modify_index = 0) {
  KVPair pair;
  pair.key          = key;
  pair.value        = value;
  pair.modify_index = modify_index;
  return pair;
}

void TestCheckAndSetCreateOnlyAndVersioned() {
  MemoryStore store;

  assert(store.CheckAndSet(Pair("a/1", "one")));
  const auto created = store.CheckAndSet(Pair("a/1", "again"));
  assert(!created && created.code == ErrorCode::Conflict);

  auto current = store.Get("a/1");
  assert(current && current->value == "one");

  const auto stale = store.CheckAndSet(Pair("a/1", "two", current->modify_index + 100));
  assert(stale.code == ErrorCode::Conflict);

  assert(store.CheckAndSet(Pair("a/1", "two", current->modify_index)));
  auto updated = store.Get("a/1");
  assert(updated->value == "two");
  assert(updated->modify_index > current->modify_index);
  assert(updated->create_index == current->create_index);
}

void TestListIsSortedAndPrefixScoped() {
  MemoryStore store;
  assert(store.Put(Pair("b/2", "x")));
  assert(store.Put(Pair("b/1", "y")));
  assert(store.Put(Pair("bb/1", "z")));

  const auto pairs = store.List("b/");
  assert(pairs.size() == 2);
  assert(pairs[0].key == "b/1");
  assert(pairs[1].key == "b/2");
}

void TestDeleteCheckAndSet() {
  MemoryStore store;
  assert(store.Put(Pair("k", "v")));
  const auto pair = store.Get("k");

  assert(store.DeleteCheckAndSet("k", pair->modify_index + 1).code == ErrorCode::Conflict);
  assert(store.Get("k"));
  assert(store.DeleteCheckAndSet("k", pair->modify_index));
  assert(!store.Get("k"));
  assert(store.DeleteCheckAndSet("k", pair->modify_index).code == ErrorCode::NotFound);

  // plain delete of a missing key is fine
  assert(store.Delete("k"));
}

void TestLocksAreExclusiveAndDieWithSession() {
  MemoryStore store;
  const auto  a = store.CreateSession("a", std::chrono::seconds(30));
  const auto  b = store.CreateSession("b", std::chrono::seconds(30));

  assert(store.Acquire("lock/x", a));
  assert(store.Acquire("lock/x", a)); // re-entrant for the holder
  assert(store.Acquire("lock/x", b).code == ErrorCode::Conflict);
  assert(store.Release("lock/x", b).code == ErrorCode::Conflict);

  assert(store.DestroySession(a));
  assert(!store.Get("lock/x"));
  assert(store.Acquire("lock/x", b));
  assert(store.Acquire("lock/y", a).code == ErrorCode::NotFound);
}

void TestExpiredSessionReleasesLocks() {
  MemoryStore store;
  const auto  short_lived = store.CreateSession("short", std::chrono::milliseconds(20));
  const auto  other       = store.CreateSession("other", std::chrono::seconds(30));

  assert(store.Acquire("lock/z", short_lived));
  std::this_thread::sleep_for(std::chrono::milliseconds(60));

  assert(store.RenewSession(short_lived).code == ErrorCode::NotFound);
  assert(store.Acquire("lock/z", other));
}

void TestWaitIndexSeesWritesAndDeletes() {
  MemoryStore store;
  assert(store.Put(Pair("w/a", "1")));
  const auto start = store.WaitIndex("w/", 0, std::chrono::milliseconds(0));
  assert(start > 0);

  // nothing changes: times out at the same index
  assert(store.WaitIndex("w/", start, std::chrono::milliseconds(20)) == start);

  std::thread writer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    assert(store.Delete("w/a"));
  });
  const auto after_delete = store.WaitIndex("w/", start, std::chrono::seconds(5));
  writer.join();
  assert(after_delete > start);

  // writes elsewhere do not wake the prefix
  assert(store.Put(Pair("other", "1")));
  assert(store.WaitIndex("w/", after_delete, std::chrono::milliseconds(10)) == after_delete);
}

void TestTombstonesStayBounded() {
  MemoryStore store(8);

  for (int i = 0; i < 100; ++i) {
    assert(store.Put(Pair("gone/" + std::to_string(i), "x")));
  }
  const auto before = store.WaitIndex("gone/0", 0, std::chrono::milliseconds(0));

  for (int i = 0; i < 100; ++i) {
    assert(store.Delete("gone/" + std::to_string(i)));
    assert(store.TombstoneCount() <= 8);
  }
  assert(store.TombstoneCount() == 8);

  // the tombstone of gone/0 was evicted; its watcher still wakes
  assert(store.WaitIndex("gone/0", before, std::chrono::milliseconds(0)) > before);

  // rewriting a key clears its tombstone
  assert(store.Put(Pair("gone/99", "back")));
  assert(store.TombstoneCount() == 7);

  // the floor does not keep waking a watcher that has caught up
  const auto caught_up = store.WaitIndex("gone/0", 0, std::chrono::milliseconds(0));
  assert(store.WaitIndex("gone/0", caught_up, std::chrono::milliseconds(10)) == caught_up);
}

} // namespace

int main() {
  TestCheckAndSetCreateOnlyAndVersioned();
  TestListIsSortedAndPrefixScoped();
  TestDeleteCheckAndSet();
  TestLocksAreExclusiveAndDieWithSession();
  TestExpiredSessionReleasesLocks();
  TestWaitIndexSeesWritesAndDeletes();
  TestTombstonesStayBounded();

  std::cout << "orchestrator_unit_memory_store: pass\n";
  return 0;
}
