/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 - 2025 NVIDIA Corporation & Affiliates.                  *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include <stdexcept>
#include <string>

namespace pcmgen::qec {

/// @brief A caller-supplied value was rejected: an unsupported code distance,
/// an unknown code name or an invalid configuration entry.
class invalid_parameter_error : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/// @brief A file or directory that must already exist does not.
class path_not_found_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// @brief Writing a matrix to disk failed.
class write_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// @brief Malformed input: a CSV matrix or a YAML configuration.
class parse_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace pcmgen::qec
