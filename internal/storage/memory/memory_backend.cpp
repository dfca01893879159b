#include "memory_backend.hpp"

#include <algorithm>
#include <set>

#include "internal/util/errors.hpp"

namespace mapper::storage::memory {

MemoryBackend::MemoryBackend() = default;

model::Identifier MemoryBackend::Insert(const Scope& scope, const model::ValueMap& values, std::optional<model::Identifier> requested) {
  if (requested) {
    CheckRequestedIdentifier(scope, *requested);
  }

  std::scoped_lock lock(mutex_);
  auto&            table = tables_[scope.Key()];
  table.database         = scope.database;

  model::Identifier id{table.next_id};
  if (requested) {
    id = *requested;
    if (table.rows.count(id)) {
      throw util::DuplicateKeyError("model '" + scope.model + "' in '" + scope.database + "' already has a record with identifier " +
                                    std::to_string(id.value));
    }
    table.next_id = std::max(table.next_id, id.value + 1);
  } else {
    CheckAssignedIdentifier(scope, table.next_id);
    table.next_id++;
  }

  table.rows.emplace(id, values);
  return id;
}

std::optional<model::ValueMap> MemoryBackend::Fetch(const Scope& scope, model::Identifier id) {
  std::scoped_lock lock(mutex_);
  const auto       tit = tables_.find(scope.Key());
  if (tit == tables_.end()) return std::nullopt;
  const auto rit = tit->second.rows.find(id);
  if (rit == tit->second.rows.end()) return std::nullopt;
  return rit->second;
}

model::ValueMap MemoryBackend::Update(const Scope& scope, model::Identifier id, const model::ValueMap& partial) {
  std::scoped_lock lock(mutex_);
  const auto       tit = tables_.find(scope.Key());
  if (tit == tables_.end() || !tit->second.rows.count(id)) {
    throw util::NotFoundError("model '" + scope.model + "' in '" + scope.database + "' has no record with identifier " +
                              std::to_string(id.value));
  }

  auto& row = tit->second.rows[id];
  for (const auto& [field, value] : partial) {
    row[field] = value;
  }
  return row;
}

bool MemoryBackend::Delete(const Scope& scope, model::Identifier id) {
  std::scoped_lock lock(mutex_);
  const auto       tit = tables_.find(scope.Key());
  if (tit == tables_.end()) return false;
  return tit->second.rows.erase(id) > 0;
}

std::vector<model::Identifier> MemoryBackend::ListIds(const Scope& scope) {
  std::scoped_lock               lock(mutex_);
  std::vector<model::Identifier> ids;
  const auto                     tit = tables_.find(scope.Key());
  if (tit == tables_.end()) return ids;
  ids.reserve(tit->second.rows.size());
  for (const auto& [id, _] : tit->second.rows) {
    ids.push_back(id);
  }
  return ids;
}

Sequence<StoredRow> MemoryBackend::Scan(const Scope& scope, Predicate predicate) {
  auto self = shared_from_this();
  return Sequence<StoredRow>([self, scope, predicate]() -> CursorPtr<StoredRow> {
    return std::make_unique<FetchingCursor>(self, scope, self->ListIds(scope), predicate);
  });
}

std::vector<std::string> MemoryBackend::Namespaces() {
  std::scoped_lock      lock(mutex_);
  std::set<std::string> names;
  for (const auto& [_, table] : tables_) {
    names.insert(table.database);
  }
  return {names.begin(), names.end()};
}

} // namespace mapper::storage::memory
