#pragma once

#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "pipeload/core/id.hpp"

namespace pipeload::core {

template <typename T>
concept CatalogRecord = requires(T value) {
  { value.id } -> std::convertible_to<ObjectId>;
  { value.code } -> std::convertible_to<std::string>;
};

// Insertion-ordered record store indexed by id and by catalog code.
// Iteration order is insertion order, which keeps downstream tie-breaks stable.
template <CatalogRecord T>
class CatalogStore {
 public:
  CatalogStore() = default;

  [[nodiscard]] std::size_t size() const { return items_.size(); }

  [[nodiscard]] bool contains_code(std::string_view code) const {
    return index_by_code_.contains(std::string(code));
  }

  [[nodiscard]] const T* find(ObjectId id) const {
    auto it = index_by_id_.find(id);
    if (it == index_by_id_.end()) {
      return nullptr;
    }
    return &items_[it->second];
  }

  [[nodiscard]] const T* find_by_code(std::string_view code) const {
    auto it = index_by_code_.find(std::string(code));
    if (it == index_by_code_.end()) {
      return nullptr;
    }
    return &items_[it->second];
  }

  // Returns false when either the id or the code is already taken.
  bool insert(T value) {
    if (index_by_id_.contains(value.id) || index_by_code_.contains(value.code)) {
      return false;
    }
    const std::size_t index = items_.size();
    index_by_id_[value.id] = index;
    index_by_code_[value.code] = index;
    items_.push_back(std::move(value));
    return true;
  }

  [[nodiscard]] const std::vector<T>& items() const { return items_; }

 private:
  std::vector<T> items_;
  std::unordered_map<ObjectId, std::size_t> index_by_id_;
  std::unordered_map<std::string, std::size_t> index_by_code_;
};

}  // namespace pipeload::core
