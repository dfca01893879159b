#include "internal/registry/model_registry.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using mapper::model::FieldDefinition;
using mapper::model::ModelDefinition;
using mapper::registry::ModelRegistry;

ModelDefinition MakeModel(const std::string& name, std::vector<std::string> fields) {
  ModelDefinition def;
  def.name = name;
  for (auto& field : fields) {
    FieldDefinition f;
    f.name = std::move(field);
    f.type = "text";
    def.fields.push_back(std::move(f));
  }
  return def;
}

void TestLoadAndResolve() {
  ModelRegistry registry;
  assert(registry.Size() == 0);

  registry.Load({MakeModel("users", {"name"}), MakeModel("posts", {"title"})});

  assert(registry.Size() == 2);
  assert(registry.Contains("users"));
  assert(!registry.Contains("comments"));
  assert(registry.Resolve("posts")->Find("title") != nullptr);

  auto names = registry.ModelNames();
  assert((names == std::vector<std::string>{"posts", "users"}));
}

void TestUnknownModel() {
  ModelRegistry registry;
  registry.Load({MakeModel("users", {"name"})});

  bool threw = false;
  try {
    (void)registry.Resolve("comments");
  } catch (const mapper::util::UnknownModelError& e) {
    threw = std::string(e.what()).find("comments") != std::string::npos;
  }
  assert(threw);
}

void TestReloadReplacesMapping() {
  ModelRegistry registry;
  registry.Load({MakeModel("users", {"name"})});
  registry.Load({MakeModel("users", {"name", "email"}), MakeModel("tags", {"label"})});

  assert(registry.Size() == 2);
  assert(registry.Resolve("users")->Find("email") != nullptr);

  registry.Load({});
  assert(registry.Size() == 0);
}

void TestFailedReloadKeepsPriorState() {
  ModelRegistry registry;
  registry.Load({MakeModel("users", {"name"})});
  auto before = registry.Resolve("users");

  bool threw = false;
  try {
    registry.Load({MakeModel("posts", {"title"}), MakeModel("broken", {})});
  } catch (const mapper::util::SchemaError&) {
    threw = true;
  }
  assert(threw);
  assert(registry.Size() == 1);
  assert(!registry.Contains("posts"));
  assert(registry.Resolve("users") == before);
}

void TestDuplicateModelNameRejected() {
  ModelRegistry registry;
  bool          threw = false;
  try {
    registry.Load({MakeModel("users", {"name"}), MakeModel("users", {"email"})});
  } catch (const mapper::util::SchemaError&) {
    threw = true;
  }
  assert(threw);
  assert(registry.Size() == 0);
}

void TestSnapshotSurvivesReload() {
  ModelRegistry registry;
  registry.Load({MakeModel("users", {"name"})});
  auto snapshot = registry.Snapshot();

  registry.Load({MakeModel("posts", {"title"})});
  assert(snapshot->count("users") == 1);
  assert(!registry.Contains("users"));
}

void TestConcurrentResolveDuringReload() {
  ModelRegistry registry;
  registry.Load({MakeModel("users", {"name"})});

  std::thread reader([&registry]() {
    for (int i = 0; i < 1000; ++i) {
      // Every published mapping contains users.
      assert(registry.Resolve("users")->Find("name") != nullptr);
    }
  });
  for (int i = 0; i < 100; ++i) {
    registry.Load({MakeModel("users", {"name"}), MakeModel("model_" + std::to_string(i), {"x"})});
  }
  reader.join();
  assert(registry.Size() == 2);
}

} // namespace

int main() {
  TestLoadAndResolve();
  TestUnknownModel();
  TestReloadReplacesMapping();
  TestFailedReloadKeepsPriorState();
  TestDuplicateModelNameRejected();
  TestSnapshotSurvivesReload();
  TestConcurrentResolveDuringReload();

  std::cout << "mapper_unit_model_registry: pass\n";
  return 0;
}
