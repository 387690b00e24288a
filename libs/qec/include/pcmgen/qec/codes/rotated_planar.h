/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 - 2025 NVIDIA Corporation & Affiliates.                  *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include "pcmgen/qec/code.h"

#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <vector>

namespace pcmgen::qec::rotated_planar {

/// @brief Role of a site on the stabilizer grid: X ancilla, Z ancilla or
/// unused.
enum surface_role { amx, amz, empty };

/// @brief 2d coordinate on the stabilizer or data grid
struct vec2d {
  int row;
  int col;

  vec2d(int row_in, int col_in);
};

vec2d operator+(const vec2d &lhs, const vec2d &rhs);
vec2d operator-(const vec2d &lhs, const vec2d &rhs);
bool operator==(const vec2d &lhs, const vec2d &rhs);
bool operator<(const vec2d &lhs, const vec2d &rhs);

// clang-format off
/// @brief The (d+1) x (d+1) grid of ancilla sites of a distance d rotated
/// planar code, stored row major.
///
/// Interior sites alternate Z ((row+col) even) and X ((row+col) odd). The top
/// and bottom rows carry weight-2 Z stabilizers, the left and right columns
/// weight-2 X stabilizers. For distance 3 (grid length 4):
/// ```
/// e(0,0)  e(0,1)  Z(0,2)  e(0,3)
/// X(1,0)  Z(1,1)  X(1,2)  e(1,3)
/// e(2,0)  X(2,1)  Z(2,2)  X(2,3)
/// e(3,0)  Z(3,1)  e(3,2)  e(3,3)
/// ```
///
/// Data qubits sit half a unit down and right of the ancilla sites and are
/// numbered row major:
/// ```
/// d0  d1  d2
/// d3  d4  d5
/// d6  d7  d8
/// ```
/// so the ancilla at (R, C) acts on the data qubits at (R-1, C-1), (R-1, C),
/// (R, C-1) and (R, C) that exist.
// clang-format on
class stabilizer_grid {
private:
  void generate_grid_roles();
  void generate_grid_indices();
  void generate_stabilizers();

  surface_role role_at(std::size_t row, std::size_t col) const {
    return roles[row * grid_length + col];
  }

public:
  /// @brief Number of data qubits per dimension
  uint32_t distance = 0;

  /// @brief distance + 1
  uint32_t grid_length = 0;

  /// @brief grid idx -> role, row major
  std::vector<surface_role> roles;

  /// @brief x stab index -> 2d coord
  std::vector<vec2d> x_stab_coords;

  /// @brief z stab index -> 2d coord
  std::vector<vec2d> z_stab_coords;

  /// @brief 2d coord -> x stab index
  std::map<vec2d, size_t> x_stab_indices;

  /// @brief 2d coord -> z stab index
  std::map<vec2d, size_t> z_stab_indices;

  /// @brief data index -> 2d coord
  std::vector<vec2d> data_coords;

  /// @brief 2d coord -> data index
  std::map<vec2d, size_t> data_indices;

  /// @brief Support (sorted data qubit indices) of each X stabilizer. Every
  /// entry has weight 2 or 4.
  std::vector<std::vector<size_t>> x_stabilizers;

  /// @brief Support (sorted data qubit indices) of each Z stabilizer.
  std::vector<std::vector<size_t>> z_stabilizers;

  stabilizer_grid(uint32_t distance);
  stabilizer_grid();

  /// @brief Print the role of every site, including empty ones
  void print_stabilizer_grid(std::ostream &os = std::cout) const;

  /// @brief Print the coordinates of the occupied sites
  void print_stabilizer_coords(std::ostream &os = std::cout) const;

  /// @brief Print the X/Z stabilizer index of each occupied site
  void print_stabilizer_indices(std::ostream &os = std::cout) const;

  /// @brief Print the data qubit indices
  void print_data_grid(std::ostream &os = std::cout) const;

  /// @brief Print the coord <--> index maps
  void print_stabilizer_maps(std::ostream &os = std::cout) const;

  /// @brief Print the stabilizers in sparse Pauli format, e.g. "s[0]: X0 X3"
  void print_stabilizers(std::ostream &os = std::cout) const;

  /// @brief X stabilizers followed by Z stabilizers as Pauli terms on
  /// distance^2 qubits
  std::vector<cudaq::spin_op_term> get_spin_op_stabilizers() const;

  /// @brief Logical X along the top data row, then logical Z along the left
  /// data column
  std::vector<cudaq::spin_op_term> get_spin_op_observables() const;
};

/// @brief Rotated planar surface code of odd distance d >= 3.
///
/// Options:
/// - "distance" (required): any integral type
class rotated_planar : public pcmgen::qec::code {
protected:
  std::size_t distance;

public:
  /// @return distance^2
  std::size_t get_num_data_qubits() const override;

  /// @return distance^2 - 1
  std::size_t get_num_ancilla_qubits() const override;

  /// @return (distance^2 - 1) / 2
  std::size_t get_num_ancilla_x_qubits() const override;

  /// @return (distance^2 - 1) / 2
  std::size_t get_num_ancilla_z_qubits() const override;

  std::size_t get_distance() const { return distance; }

  /// @throw invalid_parameter_error if "distance" is missing, not an integer,
  /// even or smaller than 3
  rotated_planar(const heterogeneous_map &options);

  PCMGEN_EXTENSION_CUSTOM_CREATOR_FUNCTION_WITH_NAME(
      rotated_planar, "rotated_planar",
      static std::unique_ptr<pcmgen::qec::code> create(
          const pcmgen::heterogeneous_map &options) {
        return std::make_unique<rotated_planar>(options);
      })

  /// @brief Geometry the stabilizers were derived from
  stabilizer_grid grid;
};

/// @brief Build the distance @p distance rotated planar code through the code
/// registry.
/// @throw invalid_parameter_error for unsupported distances
std::unique_ptr<pcmgen::qec::code> build_surface_code(std::size_t distance);

} // namespace pcmgen::qec::rotated_planar
