/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 - 2025 NVIDIA Corporation & Affiliates.                  *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "pcmgen/qec/code.h"
#include "pcmgen/qec/errors.h"

#include "common/Logger.h"

#include <algorithm>

namespace pcmgen {
PCMGEN_INSTANTIATE_REGISTRY(pcmgen::qec::code, const pcmgen::heterogeneous_map &)
}

namespace pcmgen::qec {

std::unique_ptr<code> code::get(const std::string &name,
                                const heterogeneous_map &options) {
  auto [mutex, registry] = get_registry();
  std::lock_guard<std::recursive_mutex> lock(mutex);
  auto iter = registry.find(name);
  if (iter == registry.end())
    throw invalid_parameter_error("[code] invalid code requested: " + name);
  CUDAQ_DBG("creating code '{}' with {} option(s)", name, options.size());
  return iter->second(options);
}

pcmgen::tensor<uint8_t> code::get_parity() const {
  return to_parity_matrix(m_stabilizers, stabilizer_type::XZ,
                          get_num_data_qubits());
}

pcmgen::tensor<uint8_t> code::get_parity_bsf() const {
  return to_parity_matrix(m_stabilizers, stabilizer_type::BSF,
                          get_num_data_qubits());
}

pcmgen::tensor<uint8_t> code::get_parity_x() const {
  return to_parity_matrix(m_stabilizers, stabilizer_type::X,
                          get_num_data_qubits());
}

pcmgen::tensor<uint8_t> code::get_parity_z() const {
  return to_parity_matrix(m_stabilizers, stabilizer_type::Z,
                          get_num_data_qubits());
}

pcmgen::tensor<uint8_t> code::get_pauli_observables_matrix() const {
  return to_parity_matrix(m_pauli_observables, stabilizer_type::XZ,
                          get_num_data_qubits());
}

pcmgen::tensor<uint8_t> code::get_observables_x() const {
  return to_parity_matrix(m_pauli_observables, stabilizer_type::X,
                          get_num_data_qubits());
}

pcmgen::tensor<uint8_t> code::get_observables_z() const {
  return to_parity_matrix(m_pauli_observables, stabilizer_type::Z,
                          get_num_data_qubits());
}

std::unique_ptr<code> get_code(const std::string &name,
                               const heterogeneous_map &options) {
  return code::get(name, options);
}

std::vector<std::string> get_available_codes() {
  auto names = code::get_registered();
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace pcmgen::qec
