/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 - 2025 NVIDIA Corporation & Affiliates.                  *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include "pcmgen/qec/code.h"
#include "pcmgen/qec/generator_config.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace pcmgen::qec {

/// @brief Return the stabilizer matrix of @p c in the requested layout.
pcmgen::tensor<uint8_t>
extract_matrix(const code &c, stabilizer_type type = stabilizer_type::BSF);

/// @brief Builds the code for one distance.
using code_builder = std::function<std::unique_ptr<code>(std::size_t)>;

/// @brief Builder that looks @p name up in the code registry with option
/// "distance".
code_builder registry_builder(const std::string &name);

/// @brief Writes one parity-check matrix file per configured distance.
///
/// For each distance, in order: build the code, extract its matrix, write it
/// to pcm_output_path(). The first failure propagates and the remaining
/// distances are skipped. Files already written are kept.
class generator {
private:
  config::generator_config m_config;
  code_builder m_builder;

public:
  /// @brief Use the registry builder for config.code
  explicit generator(config::generator_config config = {});

  generator(config::generator_config config, code_builder builder);

  const config::generator_config &get_config() const { return m_config; }

  /// @brief Run all distances.
  /// @return Paths of the files written, in distance order
  /// @throw invalid_parameter_error, path_not_found_error, write_error from
  /// the failing step
  std::vector<std::string> run() const;

  /// @brief Build, extract and write a single distance.
  /// @return Path of the file written
  std::string run_one(std::size_t distance) const;
};

} // namespace pcmgen::qec
