#pragma once

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace stakeline::execution {

/// Undo log backing atomic entry points.
///
/// Every mutation of engine state records the inverse operation. A
/// checkpoint marks the start of an entry point; accept keeps its
/// mutations (folding them into the enclosing checkpoint when nested) and
/// reject replays the undo entries recorded since the checkpoint in reverse.
/// Mutations made outside any checkpoint are not recorded.
class journal final {
 public:
  using undo_t = std::function<void()>;

  journal() = default;
  journal(const journal&) = delete;
  journal& operator=(const journal&) = delete;

  void checkpoint();
  void accept();
  void reject();

  std::size_t depth() const { return checkpoints_.size(); }
  std::size_t size() const { return entries_.size(); }

  void record(undo_t undo);

  /// Assign and record the previous value.
  template <typename T, typename U>
  void assign(T& target, U&& value) {
    record([&target, previous = target]() { target = previous; });
    target = std::forward<U>(value);
  }

  /// Insert or overwrite map[key] and record how to restore it.
  template <typename Map, typename Key, typename Value>
  void put(Map& map, const Key& key, Value&& value) {
    auto it = map.find(key);
    if (it == std::end(map)) {
      record([&map, key]() { map.erase(key); });
      map.emplace(key, std::forward<Value>(value));
      return;
    }
    record([&map, key, previous = it->second]() { map[key] = previous; });
    it->second = std::forward<Value>(value);
  }

  /// Erase map[key] if present and record how to restore it.
  template <typename Map, typename Key>
  void erase(Map& map, const Key& key) {
    auto it = map.find(key);
    if (it == std::end(map)) {
      return;
    }
    record([&map, key, previous = it->second]() { map.emplace(key, previous); });
    map.erase(it);
  }

  /// Set variant of put/erase.
  template <typename Set, typename Key>
  void insert(Set& set, const Key& key) {
    if (set.insert(key).second) {
      record([&set, key]() { set.erase(key); });
    }
  }

  template <typename Set, typename Key>
  void remove(Set& set, const Key& key) {
    if (set.erase(key) > 0) {
      record([&set, key]() { set.insert(key); });
    }
  }

 private:
  std::vector<undo_t> entries_;
  std::vector<std::size_t> checkpoints_;
};

/// Scoped checkpoint: rejects on destruction unless accepted.
class journal_frame final {
 public:
  explicit journal_frame(journal& journal) : journal_{journal} {
    journal_.checkpoint();
  }
  journal_frame(const journal_frame&) = delete;
  journal_frame& operator=(const journal_frame&) = delete;

  ~journal_frame() {
    if (!closed_) {
      journal_.reject();
    }
  }

  bool outermost() const { return journal_.depth() == 1; }

  void accept() {
    closed_ = true;
    journal_.accept();
  }

  void reject() {
    closed_ = true;
    journal_.reject();
  }

 private:
  journal& journal_;
  bool closed_{false};
};

}  // namespace stakeline::execution
