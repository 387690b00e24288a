/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 - 2025 NVIDIA Corporation & Affiliates.                  *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "pcmgen/core/tensor.h"

#include "cudaq/spin_op.h"

namespace pcmgen::qec {

/// @brief Which layout of the stabilizer matrix to produce.
///
/// BSF is the binary symplectic form `[x | z]`: column q is set when the
/// generator acts with X on qubit q, column n + q when it acts with Z. XZ is
/// the block-diagonal `[H_Z 0 ; 0 H_X]`, and X and Z are the single-type
/// blocks.
enum class stabilizer_type { XZ, X, Z, BSF };

/// @brief Sort stabilizers so that Z-type operators come first, ordered by the
/// index of their first Z, followed by X-type operators ordered by the index
/// of their first X.
void sortStabilizerOps(std::vector<cudaq::spin_op_term> &ops);

/// Convert stabilizers to a parity check matrix
///
/// For stabilizer_type::XZ the result is
/// ```
/// H = [ H_Z | 0   ]
///     [ 0   | H_X ]
/// ```
/// with Z-type rows first. For BSF the rows are in the same order but the
/// halves are swapped, so X supports land in `[0, n)` and Z supports in
/// `[n, 2n)`. For X or Z only the corresponding block is returned. An empty input (or an empty requested block) gives a rank 0
/// tensor.
///
/// @param stabilizers Pure X-type or pure Z-type Pauli terms
/// @param type Block(s) to produce
/// @param num_qubits Number of columns per block. When 0, the length of the
/// longest Pauli word is used.
/// @return Tensor representing the parity check matrix
pcmgen::tensor<uint8_t>
to_parity_matrix(const std::vector<cudaq::spin_op_term> &stabilizers,
                 stabilizer_type type = stabilizer_type::XZ,
                 std::size_t num_qubits = 0);

/// @brief Same as above, from Pauli words such as "XXIXX" or "ZZIII".
pcmgen::tensor<uint8_t>
to_parity_matrix(const std::vector<std::string> &words,
                 stabilizer_type type = stabilizer_type::XZ);

/// @brief Parse "bsf", "xz", "x" or "z" (case-insensitive).
/// @throw invalid_parameter_error for anything else
stabilizer_type stabilizer_type_from_string(const std::string &name);

/// @brief Lower-case name of @p type ("bsf", "xz", "x" or "z").
std::string to_string(stabilizer_type type);

} // namespace pcmgen::qec
