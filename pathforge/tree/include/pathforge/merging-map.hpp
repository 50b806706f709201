#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

namespace pathforge {

// Map of child elements keyed by their ident. Entries can be added but never replaced nor removed:
// inserting an element under an already used key merges it into the existing one.
template <class Key, class T>
class MergingMap {
 public:
  using Map = std::map<Key, std::shared_ptr<T>, std::less<>>;
  using const_iterator = typename Map::const_iterator;

  void insert(const std::shared_ptr<T>& elem) {
    auto [it, inserted] = _map.try_emplace(KeyOf(*elem), elem);
    if (!inserted && it->second != elem) {
      it->second->merge(*elem);
    }
  }

  template <class K>
  [[nodiscard]] std::shared_ptr<T> find(const K& key) const {
    auto it = _map.find(key);
    return it == _map.end() ? nullptr : it->second;
  }

  template <class K>
  [[nodiscard]] bool contains(const K& key) const {
    return _map.contains(key);
  }

  [[nodiscard]] std::size_t size() const noexcept { return _map.size(); }

  [[nodiscard]] bool empty() const noexcept { return _map.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _map.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _map.end(); }

 protected:
  static Key KeyOf(const T& elem) {
    if constexpr (std::is_same_v<Key, std::string>) {
      return *elem.ident();
    } else {
      return elem.ident();
    }
  }

  Map _map;
};

}  // namespace pathforge
