#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/engine/data_engine.hpp"
#include "internal/storage/memory/memory_backend.hpp"
#include "internal/storage/storage_backend.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

#if MAPPER_STORAGE_SQLITE
#include "internal/storage/sqlite/sqlite_backend.hpp"
#include "internal/storage/sqlite/sqlite_db.hpp"
#endif

namespace {

using mapper::engine::DataEngine;
using mapper::engine::Op;
using mapper::engine::Where;
using mapper::model::FieldDefinition;
using mapper::model::Identifier;
using mapper::model::ModelDefinition;
using mapper::model::Null;
using mapper::model::ValueMap;
using mapper::storage::Scope;
using mapper::storage::StorageBackend;
using mapper::storage::StorageBackendPtr;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                               name;
  std::function<StorageBackendPtr()>        make_backend;
  std::function<bool()>                     supports_restart;
  std::function<void(StorageBackendPtr&)>   restart;
  std::function<void()>                     cleanup;
};

std::shared_ptr<mapper::registry::ModelRegistry> MakeRegistry() {
  FieldDefinition name{"name", "text"};
  name.unique = true;
  FieldDefinition age{"age", "integer"};
  age.nullable = true;
  FieldDefinition joined{"joined", "timestamp"};
  joined.nullable = true;
  FieldDefinition rating{"rating", "float"};
  rating.nullable = true;
  FieldDefinition active{"active", "boolean"};
  active.default_value = mapper::model::Value{true};

  auto registry = std::make_shared<mapper::registry::ModelRegistry>();
  registry->Load({ModelDefinition{"users", {name, age, joined, rating, active}}});
  return registry;
}

void VerifyInsertFetchDelete(StorageBackend& backend, const Scope& scope) {
  const auto first  = backend.Insert(scope, ValueMap{{"name", std::string("a")}}, std::nullopt);
  const auto second = backend.Insert(scope, ValueMap{{"name", std::string("b")}}, std::nullopt);
  assert(first == Identifier{1});
  assert(second == Identifier{2});

  auto fetched = backend.Fetch(scope, first);
  assert(fetched.has_value());
  assert(std::get<std::string>(fetched->at("name")) == "a");
  assert(!backend.Fetch(scope, Identifier{99}).has_value());

  assert(backend.Delete(scope, second));
  assert(!backend.Delete(scope, second));
  assert(backend.Insert(scope, ValueMap{{"name", std::string("c")}}, std::nullopt) == Identifier{3});
}

void VerifyRequestedIdentifiers(StorageBackend& backend, const Scope& scope) {
  assert(backend.Insert(scope, ValueMap{}, Identifier{20}) == Identifier{20});
  assert(backend.Insert(scope, ValueMap{}, std::nullopt) == Identifier{21});

  bool threw = false;
  try {
    backend.Insert(scope, ValueMap{}, Identifier{20});
  } catch (const mapper::util::DuplicateKeyError&) {
    threw = true;
  }
  assert(threw);
}

void VerifyIdentifierRange(StorageBackend& backend, const Scope& scope) {
  const auto max = mapper::storage::kMaxIdentifier;
  assert(backend.Insert(scope, ValueMap{}, Identifier{5}) == Identifier{5});

  bool threw = false;
  try {
    backend.Insert(scope, ValueMap{}, Identifier{max + 8});
  } catch (const mapper::util::InvalidArgumentError&) {
    threw = true;
  }
  assert(threw);
  assert(!backend.Fetch(scope, Identifier{max + 8}).has_value());

  // The largest accepted identifier still scans after the small ones.
  assert(backend.Insert(scope, ValueMap{}, Identifier{max}) == Identifier{max});
  std::vector<std::uint64_t> ids;
  for (const auto& row : backend.Scan(scope, {})) {
    ids.push_back(row.id.value);
  }
  assert((ids == std::vector<std::uint64_t>{5, max}));

  threw = false;
  try {
    backend.Insert(scope, ValueMap{}, std::nullopt);
  } catch (const mapper::util::StorageError&) {
    threw = true;
  }
  assert(threw);
}

void VerifyUpdate(StorageBackend& backend, const Scope& scope) {
  const auto id     = backend.Insert(scope, ValueMap{{"name", std::string("u")}, {"age", std::int64_t{1}}}, std::nullopt);
  auto       merged = backend.Update(scope, id, ValueMap{{"age", Null{}}});
  assert(std::get<std::string>(merged.at("name")) == "u");
  assert(mapper::model::IsNull(merged.at("age")));
  assert(mapper::model::IsNull(backend.Fetch(scope, id)->at("age")));

  bool threw = false;
  try {
    backend.Update(scope, Identifier{12345}, ValueMap{{"age", std::int64_t{2}}});
  } catch (const mapper::util::NotFoundError&) {
    threw = true;
  }
  assert(threw);
}

void VerifyScanOrderAndRestart(StorageBackend& backend, const Scope& scope) {
  for (int i = 0; i < 5; ++i) {
    backend.Insert(scope, ValueMap{{"age", std::int64_t{i}}}, std::nullopt);
  }

  auto rows = backend.Scan(scope, [](const mapper::storage::StoredRow& row) { return std::get<std::int64_t>(row.values.at("age")) % 2 == 0; });

  std::vector<std::uint64_t> ids;
  for (const auto& row : rows) {
    ids.push_back(row.id.value);
  }
  assert((ids == std::vector<std::uint64_t>{1, 3, 5}));

  backend.Insert(scope, ValueMap{{"age", std::int64_t{6}}}, std::nullopt);
  assert(rows.ToVector().size() == 4);
}

void VerifyValueKindsRoundTrip(StorageBackend& backend, const Scope& scope) {
  const auto when = mapper::util::FromUnixMicros(1'700'000'000'123'456);
  ValueMap   values{{"i", std::int64_t{-7}},           {"f", 0.25},     {"t", std::string("héllo")}, {"b", false},
                    {"ts", when},                       {"ref", Identifier{9}}, {"n", Null{}}};

  const auto id      = backend.Insert(scope, values, std::nullopt);
  const auto fetched = backend.Fetch(scope, id);
  assert(fetched.has_value());
  assert(fetched->size() == values.size());
  for (const auto& [field, value] : values) {
    assert(fetched->at(field).index() == value.index());
    assert(mapper::model::Equals(fetched->at(field), value));
  }
}

void VerifyScopesAreIsolated(StorageBackend& backend) {
  const Scope left{"iso_left", "users"};
  const Scope right{"iso_right", "users"};
  backend.Insert(left, ValueMap{{"name", std::string("x")}}, std::nullopt);
  assert(backend.Scan(right, nullptr).ToVector().empty());
  assert(!backend.Fetch(right, Identifier{1}).has_value());

  const auto namespaces = backend.Namespaces();
  bool       found      = false;
  for (const auto& ns : namespaces) {
    found = found || ns == "iso_left";
  }
  assert(found);
}

void VerifyEngineScenario(const StorageBackendPtr& backend) {
  DataEngine engine(MakeRegistry(), backend, "engine_db");

  auto alice = engine.Create("users", ValueMap{{"name", std::string("Alice")}, {"age", std::int64_t{30}},
                                               {"joined", std::string("2024-01-02T03:04:05.678Z")}, {"rating", std::int64_t{4}}});
  assert(alice.Id() == Identifier{1});
  assert(alice.Get<bool>("active"));
  assert(alice.Get<double>("rating") == 4.0);

  bool threw = false;
  try {
    engine.Create("users", ValueMap{{"name", std::string("Alice")}, {"age", std::int64_t{25}}});
  } catch (const mapper::util::DuplicateKeyError&) {
    threw = true;
  }
  assert(threw);

  engine.Create("users", ValueMap{{"name", std::string("Bob")}, {"age", std::int64_t{12}}});

  auto adults = engine.Query("users", {Where("age", Op::kGreaterThan, std::int64_t{20})}).ToVector();
  assert(adults.size() == 1);
  assert(adults[0] == alice);
  assert(*engine.Get("users", alice.Id()) == alice);

  auto updated = engine.Update("users", alice.Id(), ValueMap{{"age", std::int64_t{31}}});
  assert(updated.Get<std::int64_t>("age") == 31);
  assert(updated.Get<mapper::util::TimePoint>("joined") == alice.Get<mapper::util::TimePoint>("joined"));

  assert(engine.Delete("users", alice.Id()));
  assert(!engine.Delete("users", alice.Id()));
  assert(engine.Count("users") == 1);
}

void VerifyRestartDurability(BackendFactory& factory, StorageBackendPtr& backend) {
  if (!factory.supports_restart()) {
    return;
  }
  const Scope scope{"durable", "users"};
  const auto  id = backend->Insert(scope, ValueMap{{"name", std::string("kept")}}, std::nullopt);
  assert(backend->Delete(scope, backend->Insert(scope, ValueMap{}, std::nullopt)));

  factory.restart(backend);

  auto fetched = backend->Fetch(scope, id);
  assert(fetched.has_value());
  assert(std::get<std::string>(fetched->at("name")) == "kept");
  // Counter survives restart; deleted identifiers stay retired.
  assert(backend->Insert(scope, ValueMap{}, std::nullopt) == Identifier{3});
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_backend     = []() -> StorageBackendPtr { return std::make_shared<mapper::storage::memory::MemoryBackend>(); },
      .supports_restart = []() { return false; },
      .restart          = [](StorageBackendPtr&) {},
      .cleanup          = []() {},
  };
}

#if MAPPER_STORAGE_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("mapper_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto open = [db_path]() -> StorageBackendPtr {
    return std::make_shared<mapper::storage::sqlite::SqliteBackend>(std::make_shared<mapper::storage::sqlite::SqliteDB>(db_path));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_backend     = open,
      .supports_restart = []() { return true; },
      .restart =
          [open](StorageBackendPtr& backend) {
            backend.reset();
            backend = open();
          },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

void RunBackendSuite(BackendFactory& factory) {
  std::cout << "running backend suite: " << factory.name << "\n";
  auto backend = factory.make_backend();

  VerifyInsertFetchDelete(*backend, Scope{"parity", "basic"});
  VerifyRequestedIdentifiers(*backend, Scope{"parity", "requested"});
  VerifyIdentifierRange(*backend, Scope{"parity", "range"});
  VerifyUpdate(*backend, Scope{"parity", "update"});
  VerifyScanOrderAndRestart(*backend, Scope{"parity", "scan"});
  VerifyValueKindsRoundTrip(*backend, Scope{"parity", "kinds"});
  VerifyScopesAreIsolated(*backend);
  VerifyEngineScenario(backend);
  VerifyRestartDurability(factory, backend);

  backend.reset();
  factory.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if MAPPER_STORAGE_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "mapper_integration_backend_parity: pass\n";
  return 0;
}
