#pragma once

#include <concepts>
#include <cstddef>
#include <unordered_map>
#include <utility>
#include <vector>

#include "proflex/core/id.hpp"

namespace proflex::core {

template <typename T>
concept HasObjectId = requires(T value) {
  { value.id } -> std::convertible_to<ObjectId>;
};

// Id-indexed vector. Items keep their insertion order across removals because the canvas draws
// them in that order.
template <HasObjectId T>
class ObjectStore {
 public:
  ObjectStore() = default;

  [[nodiscard]] std::size_t size() const { return items_.size(); }

  [[nodiscard]] bool empty() const { return items_.empty(); }

  [[nodiscard]] bool contains(ObjectId id) const { return index_by_id_.contains(id); }

  [[nodiscard]] T* find(ObjectId id) {
    auto it = index_by_id_.find(id);
    if (it == index_by_id_.end()) {
      return nullptr;
    }
    return &items_[it->second];
  }

  [[nodiscard]] const T* find(ObjectId id) const {
    auto it = index_by_id_.find(id);
    if (it == index_by_id_.end()) {
      return nullptr;
    }
    return &items_[it->second];
  }

  // Returns false and leaves the store unchanged when the id is already present.
  bool insert(T value) {
    const ObjectId id = value.id;
    if (index_by_id_.contains(id)) {
      return false;
    }
    items_.push_back(std::move(value));
    index_by_id_[id] = items_.size() - 1;
    return true;
  }

  bool remove(ObjectId id) {
    auto it = index_by_id_.find(id);
    if (it == index_by_id_.end()) {
      return false;
    }
    items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(it->second));
    rebuild_index();
    return true;
  }

  template <typename Pred>
  std::vector<ObjectId> remove_if(Pred pred) {
    std::vector<ObjectId> removed;
    std::vector<T> kept;
    kept.reserve(items_.size());
    for (T& item : items_) {
      if (pred(static_cast<const T&>(item))) {
        removed.push_back(item.id);
      } else {
        kept.push_back(std::move(item));
      }
    }
    if (!removed.empty()) {
      items_ = std::move(kept);
      rebuild_index();
    }
    return removed;
  }

  void clear() {
    items_.clear();
    index_by_id_.clear();
  }

  [[nodiscard]] const std::vector<T>& items() const { return items_; }

 private:
  void rebuild_index() {
    index_by_id_.clear();
    for (std::size_t i = 0; i < items_.size(); ++i) {
      index_by_id_[items_[i].id] = i;
    }
  }

  std::vector<T> items_;
  std::unordered_map<ObjectId, std::size_t> index_by_id_;
};

}  // namespace proflex::core
