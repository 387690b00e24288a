/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 - 2025 NVIDIA Corporation & Affiliates.                  *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "pcmgen/qec/stabilizer_utils.h"

#include "pcmgen/core/extension_point.h"
#include "pcmgen/core/heterogeneous_map.h"
#include "pcmgen/core/tensor.h"

namespace pcmgen::qec {

/// @brief Base class for quantum error correcting codes.
/// @details
/// A code owns its stabilizer generators and logical observables as Pauli
/// terms on the data qubits and exposes them as binary matrices.
///
/// To implement a new code:
/// 1. Create a new class that inherits from code
/// 2. Implement the virtual qubit count methods
/// 3. Fill m_stabilizers and m_pauli_observables in the constructor
/// 4. Declare a creator with PCMGEN_EXTENSION_CUSTOM_CREATOR_FUNCTION_WITH_NAME
/// and register the type with PCMGEN_REGISTER_TYPE
///
/// Example implementation:
/// @code{.cpp}
/// class my_code : public qec::code {
/// public:
///   std::size_t get_num_data_qubits() const override { return 4; }
///   std::size_t get_num_ancilla_qubits() const override { return 2; }
///   std::size_t get_num_ancilla_x_qubits() const override { return 1; }
///   std::size_t get_num_ancilla_z_qubits() const override { return 1; }
///
///   my_code(const heterogeneous_map &options) : code() {
///     m_stabilizers = fromPauliWords({"XXXX", "ZZZZ"});
///   }
///
///   PCMGEN_EXTENSION_CUSTOM_CREATOR_FUNCTION_WITH_NAME(
///     my_code, "my_code",
///     static std::unique_ptr<qec::code> create(const heterogeneous_map
/// &options) { return std::make_unique<my_code>(options);
///     }
///   )
/// };
///
/// PCMGEN_REGISTER_TYPE(my_code)
/// @endcode
class code : public extension_point<code, const heterogeneous_map &> {
protected:
  /// @brief Stabilizer generators for the code
  std::vector<cudaq::spin_op_term> m_stabilizers;

  /// @brief Pauli Logical operators
  std::vector<cudaq::spin_op_term> m_pauli_observables;

  std::vector<cudaq::spin_op_term>
  fromPauliWords(const std::vector<std::string> &words) {
    std::vector<cudaq::spin_op_term> ops;
    for (auto &os : words)
      ops.emplace_back(cudaq::spin_op::from_word(os));
    sortStabilizerOps(ops);
    return ops;
  }

public:
  /// @brief Get the number of physical data qubits needed for the code
  /// @return Number of data qubits
  virtual std::size_t get_num_data_qubits() const = 0;

  /// @brief Get the total number of ancilla qubits needed
  /// @return Total number of ancilla qubits
  virtual std::size_t get_num_ancilla_qubits() const = 0;

  /// @brief Get number of ancilla qubits needed for X stabilizer measurements
  /// @return Number of X-type ancilla qubits
  virtual std::size_t get_num_ancilla_x_qubits() const = 0;

  /// @brief Get number of ancilla qubits needed for Z stabilizer measurements
  /// @return Number of Z-type ancilla qubits
  virtual std::size_t get_num_ancilla_z_qubits() const = 0;

  code() = default;
  virtual ~code() {}

  /// @brief Factory method to create a code instance
  /// @param name Name of the code to create
  /// @param options Code-specific configuration options
  /// @return Unique pointer to created code instance
  /// @throw invalid_parameter_error if no code is registered under @p name
  static std::unique_ptr<code> get(const std::string &name,
                                   const heterogeneous_map &options = {});

  /// @brief Get the full parity check matrix H = [H_Z 0 ; 0 H_X]
  /// @return Tensor representing the parity check matrix
  pcmgen::tensor<uint8_t> get_parity() const;

  /// @brief Get the parity check matrix in binary symplectic form, each row
  /// being `[x | z]`
  pcmgen::tensor<uint8_t> get_parity_bsf() const;

  /// @brief Get the X component of the parity check matrix
  /// @return Tensor representing Hx
  pcmgen::tensor<uint8_t> get_parity_x() const;

  /// @brief Get the Z component of the parity check matrix
  /// @return Tensor representing Hz
  pcmgen::tensor<uint8_t> get_parity_z() const;

  /// @brief Get the logical observables in the same layout as get_parity()
  pcmgen::tensor<uint8_t> get_pauli_observables_matrix() const;

  /// @brief Get the Lx observables
  pcmgen::tensor<uint8_t> get_observables_x() const;

  /// @brief Get the Lz observables
  pcmgen::tensor<uint8_t> get_observables_z() const;

  /// @brief Get the stabilizer generators
  const std::vector<cudaq::spin_op_term> &get_stabilizers() const {
    return m_stabilizers;
  }

  const std::vector<cudaq::spin_op_term> &get_pauli_observables() const {
    return m_pauli_observables;
  }
};

/// Factory function to create a code instance
/// @param name Name of the code
/// @param options Code-specific options, e.g. {{"distance", 5}}
/// @return Unique pointer to the created code instance
std::unique_ptr<code> get_code(const std::string &name,
                               const heterogeneous_map &options = {});

/// Get a list of available quantum error correcting codes
/// @return Names of the registered codes, sorted
std::vector<std::string> get_available_codes();

} // namespace pcmgen::qec
