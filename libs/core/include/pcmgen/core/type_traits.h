/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 - 2025 NVIDIA Corporation & Affiliates.                  *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>

namespace pcmgen {

/// @brief Map a scalar type to the string used in tensor implementation
/// registry keys.
template <typename T>
constexpr std::string_view type_to_string() {
  if constexpr (std::is_same_v<T, std::uint8_t>)
    return "uint8";
  else if constexpr (std::is_same_v<T, int>)
    return "int";
  else
    static_assert(sizeof(T) == 0, "unsupported scalar type");
}

/// @brief True for raw character arrays and character pointers, which
/// heterogeneous_map stores as std::string.
template <typename T>
struct is_bounded_char_array : std::false_type {};

template <std::size_t N>
struct is_bounded_char_array<char[N]> : std::true_type {};

template <>
struct is_bounded_char_array<const char *> : std::true_type {};

template <>
struct is_bounded_char_array<char *> : std::true_type {};

/// @brief Types a stored value may be converted from when the requested type
/// does not match exactly.
template <typename T>
struct RelatedTypesMap {
  using types = std::tuple<>;
};

template <>
struct RelatedTypesMap<int> {
  using types = std::tuple<std::size_t, long, short, unsigned int>;
};

template <>
struct RelatedTypesMap<std::size_t> {
  using types = std::tuple<int, long, short, unsigned int>;
};

template <>
struct RelatedTypesMap<long> {
  using types = std::tuple<int, std::size_t, short, unsigned int>;
};

template <>
struct RelatedTypesMap<short> {
  using types = std::tuple<int, long, std::size_t, unsigned int>;
};

template <>
struct RelatedTypesMap<double> {
  using types = std::tuple<float>;
};

template <>
struct RelatedTypesMap<float> {
  using types = std::tuple<double>;
};

template <>
struct RelatedTypesMap<std::string> {
  using types = std::tuple<const char *>;
};

} // namespace pcmgen
