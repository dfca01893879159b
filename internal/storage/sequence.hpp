#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace mapper::storage {

/*
  Pull cursor over a finite run of items.

  Next() returns nullopt once exhausted and keeps returning nullopt.
*/
template <typename T>
class Cursor {
 public:
  virtual ~Cursor() = default;

  virtual std::optional<T> Next() = 0;
};

template <typename T>
using CursorPtr = std::unique_ptr<Cursor<T>>;

/*
  Lazy, finite, restartable sequence.

  A Sequence holds only the recipe for producing a cursor. Every call to
  begin() (or Open()) starts a fresh pass, so iterating twice re-executes
  the underlying scan and observes the store as it is at that time.

  Usage:

      for (const auto& row : backend.Scan(scope, predicate)) { ... }
*/
template <typename T>
class Sequence {
 public:
  using Factory = std::function<CursorPtr<T>()>;

  class Iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = T;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const T*;
    using reference         = const T&;

    Iterator() = default;

    explicit Iterator(std::shared_ptr<Cursor<T>> cursor) : cursor_(std::move(cursor)) {
      Advance();
    }

    reference operator*() const {
      return *current_;
    }

    pointer operator->() const {
      return &*current_;
    }

    Iterator& operator++() {
      Advance();
      return *this;
    }

    // Input iterator: all live copies share one cursor.
    void operator++(int) {
      Advance();
    }

    friend bool operator==(const Iterator& a, const Iterator& b) {
      return a.AtEnd() == b.AtEnd();
    }

    friend bool operator!=(const Iterator& a, const Iterator& b) {
      return !(a == b);
    }

   private:
    bool AtEnd() const {
      return !current_.has_value();
    }

    void Advance() {
      current_ = cursor_ ? cursor_->Next() : std::nullopt;
      if (!current_) {
        cursor_.reset();
      }
    }

    std::shared_ptr<Cursor<T>> cursor_;
    std::optional<T>           current_;
  };

  Sequence() = default;

  explicit Sequence(Factory factory) : factory_(std::move(factory)) {
  }

  CursorPtr<T> Open() const {
    if (!factory_) {
      return nullptr;
    }
    return factory_();
  }

  Iterator begin() const {
    auto cursor = Open();
    if (!cursor) {
      return Iterator();
    }
    return Iterator(std::shared_ptr<Cursor<T>>(std::move(cursor)));
  }

  Iterator end() const {
    return Iterator();
  }

  // Runs one full pass.
  std::vector<T> ToVector() const {
    std::vector<T> out;
    auto           cursor = Open();
    if (!cursor) {
      return out;
    }
    while (auto item = cursor->Next()) {
      out.push_back(std::move(*item));
    }
    return out;
  }

  // Lazily maps every item of this sequence.
  template <typename Fn>
  auto Map(Fn fn) const -> Sequence<std::decay_t<decltype(fn(std::declval<T>()))>> {
    using U      = std::decay_t<decltype(fn(std::declval<T>()))>;
    auto factory = factory_;
    return Sequence<U>([factory, fn]() -> CursorPtr<U> {
      CursorPtr<T> inner = factory ? factory() : nullptr;
      return std::make_unique<MapCursor<U, Fn>>(std::move(inner), fn);
    });
  }

  // Lazily skips `offset` items and stops after `limit` items.
  Sequence Slice(std::size_t offset, std::optional<std::size_t> limit) const {
    auto factory = factory_;
    return Sequence([factory, offset, limit]() -> CursorPtr<T> {
      CursorPtr<T> inner = factory ? factory() : nullptr;
      return std::make_unique<SliceCursor>(std::move(inner), offset, limit);
    });
  }

  // Sequence over a fixed set of items; each pass copies from the start.
  static Sequence FromVector(std::vector<T> items) {
    auto shared = std::make_shared<const std::vector<T>>(std::move(items));
    return Sequence([shared]() -> CursorPtr<T> { return std::make_unique<VectorCursor>(shared); });
  }

 private:
  template <typename U, typename Fn>
  class MapCursor final : public Cursor<U> {
   public:
    MapCursor(CursorPtr<T> inner, Fn fn) : inner_(std::move(inner)), fn_(std::move(fn)) {
    }

    std::optional<U> Next() override {
      if (!inner_) {
        return std::nullopt;
      }
      auto item = inner_->Next();
      if (!item) {
        return std::nullopt;
      }
      return fn_(std::move(*item));
    }

   private:
    CursorPtr<T> inner_;
    Fn           fn_;
  };

  class SliceCursor final : public Cursor<T> {
   public:
    SliceCursor(CursorPtr<T> inner, std::size_t offset, std::optional<std::size_t> limit)
        : inner_(std::move(inner)), skip_(offset), remaining_(limit) {
    }

    std::optional<T> Next() override {
      if (!inner_ || (remaining_ && *remaining_ == 0)) {
        return std::nullopt;
      }
      for (; skip_ > 0; --skip_) {
        if (!inner_->Next()) {
          return std::nullopt;
        }
      }
      auto item = inner_->Next();
      if (item && remaining_) {
        --*remaining_;
      }
      return item;
    }

   private:
    CursorPtr<T>               inner_;
    std::size_t                skip_;
    std::optional<std::size_t> remaining_;
  };

  class VectorCursor final : public Cursor<T> {
   public:
    explicit VectorCursor(std::shared_ptr<const std::vector<T>> items) : items_(std::move(items)) {
    }

    std::optional<T> Next() override {
      if (index_ >= items_->size()) {
        return std::nullopt;
      }
      return (*items_)[index_++];
    }

   private:
    std::shared_ptr<const std::vector<T>> items_;
    std::size_t                           index_ = 0;
  };

  template <typename>
  friend class Sequence;

  Factory factory_;
};

} // namespace mapper::storage
