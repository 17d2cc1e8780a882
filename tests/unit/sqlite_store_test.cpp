#include "internal/kv/sqlite/sqlite_store.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/util/uuid.hpp"

namespace {

using orchestrator::kv::ErrorCode;
using orchestrator::kv::KVPair;
using orchestrator::kv::sqlite::SqliteDB;
using orchestrator::kv::sqlite::SqliteStore;

std::filesystem::path TempDb() {
  const auto dir = std::filesystem::temp_directory_path() / "orchestrator_sqlite_store_tests";
  std::filesystem::create_directories(dir);
  return dir / (orchestrator::util::GenerateUUIDString() + ".db");
}

std::shared_ptr<SqliteStore> Open(const std::filesystem::path& path) {
  auto store = std::make_shared<SqliteStore>(std::make_shared<SqliteDB>(path.string()), std::chrono::milliseconds(10));
  store->Bootstrap();
  return store;
}

KVPair Pair(const std::string& key, const std::string& value, uint64_t modify_index = 0) {
  KVPair pair;
  pair.key          = key;
  pair.value        = value;
  pair.modify_index = modify_index;
  return pair;
}

void TestCheckAndSetAndPersistence() {
  const auto path = TempDb();
  {
    auto store = Open(path);
    assert(store->CheckAndSet(Pair("replication_controllers/x", "{}")));
    assert(store->CheckAndSet(Pair("replication_controllers/x", "{}")).code == ErrorCode::Conflict);

    const auto pair = store->Get("replication_controllers/x");
    assert(pair);
    assert(store->CheckAndSet(Pair("replication_controllers/x", "{\"a\":1}", pair->modify_index)));
    assert(store->CheckAndSet(Pair("replication_controllers/x", "{}", pair->modify_index)).code == ErrorCode::Conflict);
  }

  auto reopened = Open(path);
  const auto pair = reopened->Get("replication_controllers/x");
  assert(pair && pair->value == "{\"a\":1}");
  assert(reopened->List("replication_controllers/").size() == 1);

  std::filesystem::remove(path);
}

void TestLocksAcrossConnections() {
  const auto path = TempDb();
  auto       one  = Open(path);
  auto       two  = Open(path);

  const auto a = one->CreateSession("a", std::chrono::seconds(30));
  const auto b = two->CreateSession("b", std::chrono::seconds(30));

  assert(one->Acquire("lock/intent/n1/p", a));
  assert(two->Acquire("lock/intent/n1/p", b).code == ErrorCode::Conflict);

  assert(one->DestroySession(a));
  assert(two->Acquire("lock/intent/n1/p", b));
  assert(two->Release("lock/intent/n1/p", b));
  assert(!two->Get("lock/intent/n1/p"));

  std::filesystem::remove(path);
}

void TestWaitIndexObservesOtherConnection() {
  const auto path   = TempDb();
  auto       reader = Open(path);
  auto       writer = Open(path);

  assert(writer->Put(Pair("labels/pod/n1/p", "{}")));
  const auto start = reader->WaitIndex("labels/pod/", 0, std::chrono::milliseconds(0));
  assert(start > 0);

  assert(writer->Delete("labels/pod/n1/p"));
  const auto next = reader->WaitIndex("labels/pod/", start, std::chrono::seconds(5));
  assert(next > start);

  std::filesystem::remove(path);
}

void TestTombstonesStayBounded() {
  const auto path = TempDb();
  auto store = std::make_shared<SqliteStore>(std::make_shared<SqliteDB>(path.string()), std::chrono::milliseconds(10), 4);
  store->Bootstrap();

  for (int i = 0; i < 20; ++i) {
    assert(store->Put(Pair("labels/pod/n" + std::to_string(i) + "/p", "{}")));
  }
  const auto before = store->WaitIndex("labels/pod/n0/", 0, std::chrono::milliseconds(0));

  for (int i = 0; i < 20; ++i) {
    assert(store->Delete("labels/pod/n" + std::to_string(i) + "/p"));
  }
  assert(store->TombstoneCount() == 4);
  assert(store->WaitIndex("labels/pod/n0/", before, std::chrono::milliseconds(0)) > before);

  // the floor survives a reopen
  auto reopened = std::make_shared<SqliteStore>(std::make_shared<SqliteDB>(path.string()), std::chrono::milliseconds(10), 4);
  reopened->Bootstrap();
  assert(reopened->WaitIndex("labels/pod/n0/", before, std::chrono::milliseconds(0)) > before);
  assert(reopened->TombstoneCount() == 4);

  std::filesystem::remove(path);
}

} // namespace

int main() {
  TestCheckAndSetAndPersistence();
  TestLocksAcrossConnections();
  TestWaitIndexObservesOtherConnection();
  TestTombstonesStayBounded();

  std::cout << "orchestrator_unit_sqlite_store: pass\n";
  return 0;
}
