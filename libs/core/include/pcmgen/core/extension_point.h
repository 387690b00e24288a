/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pcmgen {

/// @brief A named registry of subtypes of T, each constructible from
/// CtorArgs.
///
/// Subtypes declare a creator with
/// PCMGEN_EXTENSION_CUSTOM_CREATOR_FUNCTION_WITH_NAME and register themselves
/// with PCMGEN_REGISTER_TYPE. Exactly one translation unit per extension point
/// must expand PCMGEN_INSTANTIATE_REGISTRY to define the registry storage.
template <typename T, typename... CtorArgs>
class extension_point {
public:
  using creator_function = std::function<std::unique_ptr<T>(CtorArgs...)>;
  using registry_type = std::unordered_map<std::string, creator_function>;

protected:
  static std::pair<std::recursive_mutex &, registry_type &> get_registry();

public:
  virtual ~extension_point() = default;

  /// @brief Create the subtype registered under @p name.
  /// @throw std::runtime_error if nothing is registered under @p name
  static std::unique_ptr<T> get(const std::string &name, CtorArgs... args) {
    auto [mutex, registry] = get_registry();
    std::lock_guard<std::recursive_mutex> lock(mutex);
    auto iter = registry.find(name);
    if (iter == registry.end())
      throw std::runtime_error("Cannot find extension with name = " + name);

    return iter->second(std::forward<CtorArgs>(args)...);
  }

  /// @brief Names of all registered subtypes.
  static std::vector<std::string> get_registered() {
    auto [mutex, registry] = get_registry();
    std::lock_guard<std::recursive_mutex> lock(mutex);
    std::vector<std::string> names;
    for (auto &[name, creator] : registry)
      names.push_back(name);
    return names;
  }

  static bool is_registered(const std::string &name) {
    auto [mutex, registry] = get_registry();
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return registry.find(name) != registry.end();
  }
};

} // namespace pcmgen

/// Define the registry storage for extension point TYPE constructed from the
/// given argument types.
#define PCMGEN_INSTANTIATE_REGISTRY(TYPE, ...)                                 \
  template <>                                                                  \
  std::pair<std::recursive_mutex &,                                            \
            ::pcmgen::extension_point<TYPE, __VA_ARGS__>::registry_type &>     \
  pcmgen::extension_point<TYPE, __VA_ARGS__>::get_registry() {                 \
    static std::recursive_mutex mutex;                                         \
    static registry_type registry;                                             \
    return {mutex, registry};                                                  \
  }

/// Declare a creator for TYPE registered under NAME. The trailing arguments
/// must define `static std::unique_ptr<Base> create(CtorArgs...)`.
#define PCMGEN_EXTENSION_CUSTOM_CREATOR_FUNCTION_WITH_NAME(TYPE, NAME, ...)    \
protected:                                                                     \
  static const bool registered_;                                               \
                                                                               \
public:                                                                        \
  static const std::string class_identifier() { return NAME; }                 \
  __VA_ARGS__                                                                  \
  static bool register_type() {                                                \
    auto [mutex, registry] = TYPE::get_registry();                             \
    std::lock_guard<std::recursive_mutex> lock(mutex);                         \
    registry[TYPE::class_identifier()] = TYPE::create;                         \
    return true;                                                               \
  }

/// Register TYPE with its extension point at static initialization time.
#define PCMGEN_REGISTER_TYPE(TYPE)                                             \
  const bool TYPE::registered_ = TYPE::register_type();
