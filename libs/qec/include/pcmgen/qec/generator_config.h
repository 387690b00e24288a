/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 - 2025 NVIDIA Corporation & Affiliates.                  *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/

#pragma once

#include "pcmgen/core/heterogeneous_map.h"
#include "pcmgen/qec/stabilizer_utils.h"

#include <cstddef>
#include <string>
#include <vector>

namespace pcmgen::qec::config {

/// @brief Settings of a generator run. Every field has a default, so an empty
/// YAML document yields the default run.
struct generator_config {
  /// Registered code name
  std::string code = "rotated_planar";
  /// Distances to generate, in order
  std::vector<std::size_t> distances = {3, 5, 7, 9, 11, 13, 15};
  std::string output_dir = "pcm_matrices";
  /// Prepended to each file name
  std::string file_prefix;
  /// "bsf", "xz", "x" or "z"
  std::string parity_type = "bsf";
  bool create_directories = true;
  /// Single character field separator
  std::string delimiter = ",";

  bool operator==(const generator_config &) const = default;

  /// @brief Check the values that do not depend on a code being built.
  /// @throw invalid_parameter_error on an empty code name or distance list,
  /// an unknown parity type or a delimiter that is not a single non-digit
  /// character
  void validate() const;

  stabilizer_type get_parity_type() const;
  char get_delimiter() const;

  __attribute__((visibility("default"))) pcmgen::heterogeneous_map
  to_heterogeneous_map() const;

  __attribute__((visibility("default"))) static generator_config
  from_heterogeneous_map(const pcmgen::heterogeneous_map &map);

  std::string to_yaml_str(int column_wrap = 80);

  /// @throw parse_error if @p yaml_str is not a valid configuration
  static generator_config from_yaml_str(const std::string &yaml_str);

  /// @throw path_not_found_error if @p path does not exist
  /// @throw parse_error if the file is not a valid configuration
  static generator_config from_yaml_file(const std::string &path);
};

} // namespace pcmgen::qec::config
