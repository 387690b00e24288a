/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 - 2025 NVIDIA Corporation & Affiliates.                  *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include "pcmgen/core/tensor.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace pcmgen::qec {

/// @brief Options controlling how matrices are written to disk.
struct csv_options {
  /// Field separator between the values of a row.
  char delimiter = ',';
  /// Create the parent directory of the output file if it does not exist.
  /// When false a missing directory raises path_not_found_error.
  bool create_directories = true;
};

/// @brief Write a rank-2 matrix as delimited integers, one row per line.
/// @details Every row, including the last, is newline terminated and there is
/// no header. A rank 0 (empty) tensor produces an empty file. An existing
/// file at @p path is truncated.
/// @param matrix Matrix to write
/// @param path Output file
/// @param options Delimiter and directory handling
/// @throw path_not_found_error if the parent directory is missing and
/// options.create_directories is false
/// @throw write_error if the matrix is not rank 2 (or 0) or the file cannot be
/// created or written
void write_matrix_csv(const pcmgen::tensor<uint8_t> &matrix,
                      const std::string &path, const csv_options &options = {});

/// @brief Same as above for an int matrix
void write_matrix_csv(const pcmgen::tensor<int> &matrix,
                      const std::string &path, const csv_options &options = {});

/// @brief Read a binary matrix written by write_matrix_csv.
/// @details Blank lines are skipped, so an empty file, and a matrix written
/// with zero rows or zero columns, read back as a rank 0 tensor.
/// @throw path_not_found_error if @p path does not exist
/// @throw parse_error on a non-integer field, a value outside [0, 255] or
/// rows of different lengths
pcmgen::tensor<uint8_t> read_matrix_csv(const std::string &path,
                                        char delimiter = ',');

/// @brief Same as read_matrix_csv for files written from a `tensor<int>`.
/// Values may span the full int range.
pcmgen::tensor<int> read_int_matrix_csv(const std::string &path,
                                        char delimiter = ',');

/// @brief `<output_dir>/<prefix>distance_<distance>_surface_code.csv`
std::string pcm_output_path(const std::string &output_dir,
                            std::size_t distance,
                            const std::string &prefix = "");

} // namespace pcmgen::qec
