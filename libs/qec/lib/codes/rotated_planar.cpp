/*******************************************************************************
 * Copyright (c) 2024 - 2025 NVIDIA Corporation & Affiliates.                  *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "pcmgen/qec/codes/rotated_planar.h"
#include "pcmgen/qec/errors.h"

#include "common/Logger.h"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <string>

namespace pcmgen::qec::rotated_planar {

vec2d::vec2d(int row_in, int col_in) : row(row_in), col(col_in) {}

vec2d operator+(const vec2d &lhs, const vec2d &rhs) {
  return {lhs.row + rhs.row, lhs.col + rhs.col};
}

vec2d operator-(const vec2d &lhs, const vec2d &rhs) {
  return {lhs.row - rhs.row, lhs.col - rhs.col};
}

bool operator==(const vec2d &lhs, const vec2d &rhs) {
  return lhs.row == rhs.row && lhs.col == rhs.col;
}

// Row first, then column.
bool operator<(const vec2d &lhs, const vec2d &rhs) {
  if (lhs.row != rhs.row)
    return lhs.row < rhs.row;
  return lhs.col < rhs.col;
}

void stabilizer_grid::generate_grid_roles() {
  const std::size_t last = grid_length - 1;
  for (std::size_t row = 0; row < grid_length; ++row) {
    for (std::size_t col = 0; col < grid_length; ++col) {
      const bool odd = (row + col) % 2;
      const bool rowEdge = row == 0 || row == last;
      const bool colEdge = col == 0 || col == last;
      auto &role = roles[row * grid_length + col];
      role = surface_role::empty;
      if (rowEdge && colEdge)
        continue;
      if (rowEdge) {
        // weight-2 Z stabilizers along top/bottom
        if (!odd)
          role = surface_role::amz;
      } else if (colEdge) {
        // weight-2 X stabilizers along left/right
        if (odd)
          role = surface_role::amx;
      } else {
        role = odd ? surface_role::amx : surface_role::amz;
      }
    }
  }
}

void stabilizer_grid::generate_grid_indices() {
  for (std::size_t row = 0; row < grid_length; ++row) {
    for (std::size_t col = 0; col < grid_length; ++col) {
      vec2d coord(row, col);
      switch (role_at(row, col)) {
      case surface_role::amz:
        z_stab_indices[coord] = z_stab_coords.size();
        z_stab_coords.push_back(coord);
        break;
      case surface_role::amx:
        x_stab_indices[coord] = x_stab_coords.size();
        x_stab_coords.push_back(coord);
        break;
      case surface_role::empty:
        break;
      }
    }
  }

  for (std::size_t row = 0; row < distance; ++row) {
    for (std::size_t col = 0; col < distance; ++col) {
      data_indices[vec2d(row, col)] = data_coords.size();
      data_coords.push_back(vec2d(row, col));
    }
  }
}

void stabilizer_grid::generate_stabilizers() {
  auto support = [this](const vec2d &site) {
    std::vector<std::size_t> qubits;
    for (int dr = -1; dr < 1; ++dr) {
      for (int dc = -1; dc < 1; ++dc) {
        auto iter = data_indices.find(site + vec2d(dr, dc));
        if (iter != data_indices.end())
          qubits.push_back(iter->second);
      }
    }
    std::sort(qubits.begin(), qubits.end());
    return qubits;
  };

  for (auto &site : x_stab_coords)
    x_stabilizers.push_back(support(site));
  for (auto &site : z_stab_coords)
    z_stabilizers.push_back(support(site));
}

stabilizer_grid::stabilizer_grid() {}

stabilizer_grid::stabilizer_grid(uint32_t distance)
    : distance(distance), grid_length(distance + 1),
      roles(grid_length * grid_length) {
  generate_grid_roles();
  generate_grid_indices();
  generate_stabilizers();
  CUDAQ_DBG("stabilizer_grid: distance {} has {} X and {} Z stabilizers on "
            "{} data qubits",
            distance, x_stabilizers.size(), z_stabilizers.size(),
            data_coords.size());
}

static char roleChar(surface_role role) {
  switch (role) {
  case surface_role::amx:
    return 'X';
  case surface_role::amz:
    return 'Z';
  case surface_role::empty:
    break;
  }
  return 'e';
}

void stabilizer_grid::print_stabilizer_grid(std::ostream &os) const {
  const int width = std::to_string(grid_length).length();
  for (std::size_t row = 0; row < grid_length; ++row) {
    for (std::size_t col = 0; col < grid_length; ++col)
      fmt::print(os, "{}({:>{}},{:>{}})  ", roleChar(role_at(row, col)), row,
                 width, col, width);
    os << '\n';
  }
  os << '\n';
}

void stabilizer_grid::print_stabilizer_coords(std::ostream &os) const {
  const int width = std::to_string(grid_length).length();
  for (std::size_t row = 0; row < grid_length; ++row) {
    for (std::size_t col = 0; col < grid_length; ++col) {
      auto role = role_at(row, col);
      if (role == surface_role::empty)
        fmt::print(os, "{:{}}", "", 2 * width + 6);
      else
        fmt::print(os, "{}({:>{}},{:>{}})  ", roleChar(role), row, width, col,
                   width);
    }
    os << '\n';
  }
  os << '\n';
}

void stabilizer_grid::print_stabilizer_indices(std::ostream &os) const {
  const int width = std::to_string(z_stab_indices.size()).length() + 2;
  for (std::size_t row = 0; row < grid_length; ++row) {
    for (std::size_t col = 0; col < grid_length; ++col) {
      vec2d coord(row, col);
      switch (role_at(row, col)) {
      case surface_role::amz:
        fmt::print(os, "Z{:<{}}", z_stab_indices.at(coord), width);
        break;
      case surface_role::amx:
        fmt::print(os, "X{:<{}}", x_stab_indices.at(coord), width);
        break;
      case surface_role::empty:
        fmt::print(os, "{:{}}", "", width + 1);
        break;
      }
    }
    os << '\n';
  }
  os << '\n';
}

void stabilizer_grid::print_data_grid(std::ostream &os) const {
  const int width = std::to_string(distance).length() + 2;
  for (std::size_t row = 0; row < distance; ++row) {
    for (std::size_t col = 0; col < distance; ++col)
      fmt::print(os, "d{:<{}}", row * distance + col, width);
    os << '\n';
  }
  os << '\n';
}

void stabilizer_grid::print_stabilizer_maps(std::ostream &os) const {
  fmt::print(os, "{} mx ancilla qubits:\n", x_stab_coords.size());
  for (std::size_t i = 0; i < x_stab_coords.size(); ++i)
    fmt::print(os, "amx[{}] @ ({}, {})\n", i, x_stab_coords[i].row,
               x_stab_coords[i].col);
  fmt::print(os, "{} mz ancilla qubits:\n", z_stab_coords.size());
  for (std::size_t i = 0; i < z_stab_coords.size(); ++i)
    fmt::print(os, "amz[{}] @ ({}, {})\n", i, z_stab_coords[i].row,
               z_stab_coords[i].col);
  os << '\n';

  for (const auto &[k, v] : x_stab_indices)
    fmt::print(os, "@({},{}): amx[{}]\n", k.row, k.col, v);
  for (const auto &[k, v] : z_stab_indices)
    fmt::print(os, "@({},{}): amz[{}]\n", k.row, k.col, v);
  os << '\n';
}

void stabilizer_grid::print_stabilizers(std::ostream &os) const {
  std::size_t s_i = 0;
  auto printGroup = [&](const std::vector<std::vector<size_t>> &stabs,
                        char pauli) {
    for (auto &stab : stabs) {
      fmt::print(os, "s[{}]:", s_i++);
      for (auto q : stab)
        fmt::print(os, " {}{}", pauli, q);
      os << '\n';
    }
  };
  printGroup(x_stabilizers, 'X');
  printGroup(z_stabilizers, 'Z');
  os << '\n';
}

static cudaq::spin_op_term toTerm(const std::vector<std::size_t> &support,
                                  std::size_t numQubits, char pauli) {
  std::string word(numQubits, 'I');
  for (auto q : support)
    word[q] = pauli;
  return cudaq::spin_op::from_word(word);
}

std::vector<cudaq::spin_op_term>
stabilizer_grid::get_spin_op_stabilizers() const {
  std::vector<cudaq::spin_op_term> stabs;
  stabs.reserve(x_stabilizers.size() + z_stabilizers.size());
  for (auto &s : x_stabilizers)
    stabs.emplace_back(toTerm(s, data_coords.size(), 'X'));
  for (auto &s : z_stabilizers)
    stabs.emplace_back(toTerm(s, data_coords.size(), 'Z'));
  return stabs;
}

std::vector<cudaq::spin_op_term>
stabilizer_grid::get_spin_op_observables() const {
  std::vector<std::size_t> topRow, leftCol;
  for (std::size_t i = 0; i < distance; ++i) {
    topRow.push_back(i);
    leftCol.push_back(i * distance);
  }
  return {toTerm(topRow, data_coords.size(), 'X'),
          toTerm(leftCol, data_coords.size(), 'Z')};
}

static std::size_t validated_distance(const heterogeneous_map &options) {
  if (!options.contains("distance"))
    throw invalid_parameter_error(
        "[rotated_planar] distance not provided. distance must be provided via "
        "qec::get_code(..., options) options map.");

  long d = 0;
  try {
    d = options.get<long>("distance");
  } catch (const std::runtime_error &e) {
    throw invalid_parameter_error(
        "[rotated_planar] distance must be an integer (" +
        std::string(e.what()) + ")");
  }

  if (d < 3 || d % 2 == 0)
    throw invalid_parameter_error(fmt::format(
        "[rotated_planar] distance must be an odd integer >= 3 (got {}).", d));
  return static_cast<std::size_t>(d);
}

rotated_planar::rotated_planar(const heterogeneous_map &options)
    : code(), distance(validated_distance(options)), grid(distance) {
  m_stabilizers = grid.get_spin_op_stabilizers();
  m_pauli_observables = grid.get_spin_op_observables();

  // Sort once here instead of on every matrix request.
  sortStabilizerOps(m_stabilizers);
  sortStabilizerOps(m_pauli_observables);
}

std::size_t rotated_planar::get_num_data_qubits() const {
  return distance * distance;
}

std::size_t rotated_planar::get_num_ancilla_qubits() const {
  return distance * distance - 1;
}

std::size_t rotated_planar::get_num_ancilla_x_qubits() const {
  return (distance * distance - 1) / 2;
}

std::size_t rotated_planar::get_num_ancilla_z_qubits() const {
  return (distance * distance - 1) / 2;
}

std::unique_ptr<pcmgen::qec::code> build_surface_code(std::size_t distance) {
  return get_code("rotated_planar", {{"distance", distance}});
}

PCMGEN_REGISTER_TYPE(rotated_planar)

} // namespace pcmgen::qec::rotated_planar
