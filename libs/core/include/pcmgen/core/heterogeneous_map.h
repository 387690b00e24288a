/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include <any>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "pcmgen/core/tuple_utils.h"
#include "pcmgen/core/type_traits.h"

namespace pcmgen {

/// @brief String-keyed option bag holding values of any type. Codes receive
/// their construction options (e.g. "distance") through it.
class heterogeneous_map {
private:
  std::unordered_map<std::string, std::any> items;

  template <typename T>
  static const T *try_cast(const std::any &t) {
    return std::any_cast<T>(&t);
  }

public:
  heterogeneous_map() = default;
  heterogeneous_map(const heterogeneous_map &) = default;
  heterogeneous_map &operator=(const heterogeneous_map &) = default;

  /// @brief Construct from a list of key-value pairs
  heterogeneous_map(
      const std::initializer_list<std::pair<std::string, std::any>> &list) {
    for (auto &l : list)
      insert(l.first, l.second);
  }

  void clear() { items.clear(); }

  /// @brief Insert (or overwrite) a key-value pair. Character arrays and
  /// pointers are stored as std::string.
  template <typename T>
  void insert(const std::string &key, const T &value) {
    if constexpr (is_bounded_char_array<T>{})
      items.insert_or_assign(key, std::string(value));
    else
      items.insert_or_assign(key, value);
  }

  /// @brief Get a value from the map.
  /// @details If the stored value is not exactly of type T, the types listed in
  /// RelatedTypesMap<T> are tried, so an option inserted as `int` can be read
  /// back as `std::size_t` or `long`.
  /// @throw std::runtime_error if the key is missing or the type doesn't match
  template <typename T>
  T get(const std::string &key) const {
    auto iter = items.find(key);
    if (iter == items.end())
      throw std::runtime_error("heterogeneous_map::get() error - Invalid key (" +
                               key + ").");

    if (auto *value = try_cast<T>(iter->second))
      return *value;

    using RelatedTypes =
        typename RelatedTypesMap<std::remove_cvref_t<T>>::types;
    std::optional<T> opt;
    tuple_for_each(RelatedTypes(), [&](auto &&el) {
      using related_t = std::remove_cvref_t<decltype(el)>;
      if (opt.has_value())
        return;
      if (auto *value = try_cast<related_t>(iter->second))
        opt = static_cast<T>(*value);
    });

    if (opt.has_value())
      return opt.value();

    throw std::runtime_error(
        "heterogeneous_map::get() error - Invalid type or key (" + key + ").");
  }

  /// @brief Get a value from the map, or @p defaultValue when the key is
  /// absent. A present key holding an incompatible type still throws.
  template <typename T>
  T get(const std::string &key, const T &defaultValue) const {
    if (!contains(key))
      return defaultValue;
    return get<T>(key);
  }

  std::size_t size() const { return items.size(); }

  bool contains(const std::string &key) const { return items.contains(key); }
  bool contains(const std::vector<std::string> &keys) const {
    for (auto &key : keys)
      if (items.contains(key))
        return true;

    return false;
  }
};

} // namespace pcmgen
