#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/value.hpp"
#include "internal/storage/sequence.hpp"
#include "internal/util/errors.hpp"

namespace mapper::storage {

/*
  (namespace, model) pair every backend call is scoped to.
*/
struct Scope {
  std::string database;
  std::string model;

  std::string Key() const {
    return database + "#" + model;
  }

  std::string ToString() const {
    return database + "." + model;
  }
};

struct StoredRow {
  model::Identifier id;
  model::ValueMap   values;
};

using Predicate = std::function<bool(const StoredRow&)>;

// Identifiers stay within the signed 64-bit range so that backends keyed on
// signed integers scan in the same order as unsigned ones.
inline constexpr std::uint64_t kMaxIdentifier = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

// Throws InvalidArgumentError for a requested identifier above kMaxIdentifier.
inline void CheckRequestedIdentifier(const Scope& scope, model::Identifier id) {
  if (id.value > kMaxIdentifier) {
    throw util::InvalidArgumentError("identifier " + std::to_string(id.value) + " for " + scope.ToString() + " exceeds the maximum " +
                                     std::to_string(kMaxIdentifier));
  }
}

// Throws StorageError once the counter has run past kMaxIdentifier.
inline void CheckAssignedIdentifier(const Scope& scope, std::uint64_t next_id) {
  if (next_id > kMaxIdentifier) {
    throw util::StorageError("identifier space of " + scope.ToString() + " is exhausted");
  }
}

/*
  Storage abstraction.

  Value maps passed in and returned never contain the identifier field; the
  identifier travels separately as the row key. Backends store and return
  copies: nothing handed out aliases backend state.

  Every call is atomic per row. Backends enforce identifier uniqueness only;
  field-level uniqueness is the engine's job.

  Implementations:
    memory → MemoryBackend (process-local maps)
    sqlite → SqliteBackend (single file, protobuf row bodies)
*/

class StorageBackend {
 public:
  virtual ~StorageBackend() = default;

  // ------------------------------------------------------------------
  // Insert
  // ------------------------------------------------------------------
  /*
    Persist a new row and return its identifier.

    With `requested` the row is stored under that identifier
    (DuplicateKeyError if taken, InvalidArgumentError above
    kMaxIdentifier). Otherwise the next value of the per-scope counter is
    assigned. Counters start at 1 and never hand out a value twice,
    including values that were requested explicitly.
  */
  virtual model::Identifier Insert(const Scope& scope, const model::ValueMap& values, std::optional<model::Identifier> requested) = 0;

  // ------------------------------------------------------------------
  // Fetch
  // ------------------------------------------------------------------
  /*
    Absence is a normal outcome, never an error.
  */
  virtual std::optional<model::ValueMap> Fetch(const Scope& scope, model::Identifier id) = 0;

  // ------------------------------------------------------------------
  // Update
  // ------------------------------------------------------------------
  /*
    Merge `partial` into the stored row and return the full result.
    NotFoundError if the row does not exist.
  */
  virtual model::ValueMap Update(const Scope& scope, model::Identifier id, const model::ValueMap& partial) = 0;

  // ------------------------------------------------------------------
  // Delete
  // ------------------------------------------------------------------
  /*
    Returns whether a row existed and was removed.
  */
  virtual bool Delete(const Scope& scope, model::Identifier id) = 0;

  // ------------------------------------------------------------------
  // Scan
  // ------------------------------------------------------------------
  /*
    Rows matching `predicate` (all rows when empty), identifier ascending.

    Lazy and restartable: each pass snapshots the identifiers present when
    it starts and reads every row when it is reached. Rows removed in
    between are skipped.
  */
  virtual Sequence<StoredRow> Scan(const Scope& scope, Predicate predicate) = 0;

  // Namespaces that currently hold at least one model scope.
  virtual std::vector<std::string> Namespaces() = 0;

  virtual std::string Name() const = 0;
};

using StorageBackendPtr = std::shared_ptr<StorageBackend>;

/*
  Cursor shared by backends whose scans are "list ids, then fetch each".
  Holds the backend alive for the duration of the pass.
*/
class FetchingCursor final : public Cursor<StoredRow> {
 public:
  FetchingCursor(StorageBackendPtr backend, Scope scope, std::vector<model::Identifier> ids, Predicate predicate)
      : backend_(std::move(backend)), scope_(std::move(scope)), ids_(std::move(ids)), predicate_(std::move(predicate)) {
  }

  std::optional<StoredRow> Next() override {
    while (index_ < ids_.size()) {
      const auto id     = ids_[index_++];
      auto       values = backend_->Fetch(scope_, id);
      if (!values) {
        continue;
      }
      StoredRow row{id, std::move(*values)};
      if (!predicate_ || predicate_(row)) {
        return row;
      }
    }
    return std::nullopt;
  }

 private:
  StorageBackendPtr              backend_;
  Scope                          scope_;
  std::vector<model::Identifier> ids_;
  Predicate                      predicate_;
  std::size_t                    index_ = 0;
};

} // namespace mapper::storage
