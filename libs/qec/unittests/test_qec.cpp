/*******************************************************************************
 * Copyright (c) 2024 - 2025 NVIDIA Corporation & Affiliates.                  *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/

#include <algorithm>
#include <map>
#include <sstream>
#include <gtest/gtest.h>

#include "pcmgen/qec/codes/rotated_planar.h"
#include "pcmgen/qec/errors.h"
#include "pcmgen/qec/stabilizer_utils.h"

namespace {
void expectMatrix(const pcmgen::tensor<uint8_t> &actual,
                  const std::vector<std::vector<uint8_t>> &expected) {
  ASSERT_EQ(actual.rank(), 2);
  ASSERT_EQ(actual.shape()[0], expected.size());
  for (std::size_t i = 0; i < expected.size(); i++) {
    ASSERT_EQ(actual.shape()[1], expected[i].size());
    for (std::size_t j = 0; j < expected[i].size(); j++)
      EXPECT_EQ(actual.at({i, j}), expected[i][j]) << "at (" << i << ", " << j
                                                   << ")";
  }
}

// Non-zero columns of each row
std::vector<std::vector<std::size_t>>
rowSupports(const pcmgen::tensor<uint8_t> &m) {
  std::vector<std::vector<std::size_t>> rows(m.shape()[0]);
  for (std::size_t i = 0; i < m.shape()[0]; i++)
    for (std::size_t j = 0; j < m.shape()[1]; j++)
      if (m.at({i, j}))
        rows[i].push_back(j);
  return rows;
}
} // namespace

TEST(StabilizerTester, checkConstructFromSpinOps) {
  std::vector<cudaq::spin_op_term> stab{cudaq::spin_op::from_word("ZZZZIII"),
                                        cudaq::spin_op::from_word("XXXXIII"),
                                        cudaq::spin_op::from_word("IXXIXXI"),
                                        cudaq::spin_op::from_word("IIXXIXX"),
                                        cudaq::spin_op::from_word("IZZIZZI"),
                                        cudaq::spin_op::from_word("IIZZIZZ")};
  auto parity = pcmgen::qec::to_parity_matrix(stab);
  expectMatrix(parity, {{1, 1, 1, 1, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
                        {0, 1, 1, 0, 1, 1, 0, 0, 0, 0, 0, 0, 0, 0},
                        {0, 0, 1, 1, 0, 1, 1, 0, 0, 0, 0, 0, 0, 0},
                        {0, 0, 0, 0, 0, 0, 0, 1, 1, 1, 1, 0, 0, 0},
                        {0, 0, 0, 0, 0, 0, 0, 0, 1, 1, 0, 1, 1, 0},
                        {0, 0, 0, 0, 0, 0, 0, 0, 0, 1, 1, 0, 1, 1}});

  auto parity_x =
      pcmgen::qec::to_parity_matrix(stab, pcmgen::qec::stabilizer_type::X);
  expectMatrix(parity_x, {{1, 1, 1, 1, 0, 0, 0},
                          {0, 1, 1, 0, 1, 1, 0},
                          {0, 0, 1, 1, 0, 1, 1}});
}

TEST(StabilizerTester, checkConstructFromWords) {
  // Input order does not matter, rows come out sorted.
  std::vector<std::string> stab{"IIXXIXX", "IZZIZZI", "XXXXIII",
                                "IIZZIZZ", "ZZZZIII", "IXXIXXI"};
  auto parity_z =
      pcmgen::qec::to_parity_matrix(stab, pcmgen::qec::stabilizer_type::Z);
  expectMatrix(parity_z, {{1, 1, 1, 1, 0, 0, 0},
                          {0, 1, 1, 0, 1, 1, 0},
                          {0, 0, 1, 1, 0, 1, 1}});

  auto parity = pcmgen::qec::to_parity_matrix(stab);
  EXPECT_EQ(parity.shape(), (std::vector<std::size_t>{6, 14}));
  EXPECT_EQ(parity.sum_all(), 24);

  EXPECT_THROW(pcmgen::qec::to_parity_matrix(std::vector<std::string>{"XQZ"}),
               pcmgen::qec::invalid_parameter_error);
}

TEST(StabilizerTester, checkTrailingIdentitiesArePadded) {
  std::vector<cudaq::spin_op_term> stab{cudaq::spin_op::from_word("XXIII"),
                                        cudaq::spin_op::from_word("ZZIII")};
  auto parity = pcmgen::qec::to_parity_matrix(
      stab, pcmgen::qec::stabilizer_type::XZ, 5);
  expectMatrix(parity, {{1, 1, 0, 0, 0, 0, 0, 0, 0, 0},
                        {0, 0, 0, 0, 0, 1, 1, 0, 0, 0}});
}

TEST(StabilizerTester, checkSymplecticLayout) {
  std::vector<std::string> stab{"XXI", "IZZ"};
  auto bsf =
      pcmgen::qec::to_parity_matrix(stab, pcmgen::qec::stabilizer_type::BSF);
  expectMatrix(bsf, {{0, 0, 0, 0, 1, 1}, {1, 1, 0, 0, 0, 0}});

  // An X error on qubit q sits at column n + q of a (z|x) error vector, so
  // the product with a [x | z] row flags the Z checks touching q.
  auto code = pcmgen::qec::rotated_planar::build_surface_code(3);
  auto h = code->get_parity_bsf();
  const std::size_t n = 9;
  pcmgen::tensor<uint8_t> error({2 * n, 1});
  error.at({n + 4, 0}) = 1;
  auto syndrome = h.dot(error) % 2;
  expectMatrix(syndrome, {{1}, {0}, {1}, {0}, {0}, {0}, {0}, {0}});
}

TEST(StabilizerTester, checkSortUsesFullWidthWords) {
  std::vector<cudaq::spin_op_term> ops{cudaq::spin_op::from_word("IIZZ"),
                                       cudaq::spin_op::from_word("IXXI"),
                                       cudaq::spin_op::from_word("ZZII"),
                                       cudaq::spin_op::from_word("XIIX")};
  pcmgen::qec::sortStabilizerOps(ops);
  std::vector<std::string> words;
  for (auto &op : ops)
    words.push_back(op.get_pauli_word(4));
  EXPECT_EQ(words,
            (std::vector<std::string>{"ZZII", "IIZZ", "XIIX", "IXXI"}));
}

TEST(StabilizerTester, checkToParityMatrixEdgeCases) {
  {
    std::vector<cudaq::spin_op_term> empty_stab;
    auto parity_empty = pcmgen::qec::to_parity_matrix(empty_stab);
    EXPECT_EQ(parity_empty.size(), 0);
    EXPECT_EQ(parity_empty.rank(), 0);
  }
  {
    std::vector<cudaq::spin_op_term> x_only_stab{
        cudaq::spin_op::from_word("XXXIII"),
        cudaq::spin_op::from_word("IXXXII"),
        cudaq::spin_op::from_word("IIXXXI")};

    auto parity_z_only = pcmgen::qec::to_parity_matrix(
        x_only_stab, pcmgen::qec::stabilizer_type::Z);
    EXPECT_EQ(parity_z_only.size(), 0);
    EXPECT_EQ(parity_z_only.rank(), 0);

    auto parity_x_only = pcmgen::qec::to_parity_matrix(
        x_only_stab, pcmgen::qec::stabilizer_type::X);
    EXPECT_EQ(parity_x_only.shape(), (std::vector<std::size_t>{3, 6}));
  }
}

TEST(StabilizerTester, checkStabilizerTypeNames) {
  using pcmgen::qec::stabilizer_type;
  EXPECT_EQ(pcmgen::qec::stabilizer_type_from_string("xz"),
            stabilizer_type::XZ);
  EXPECT_EQ(pcmgen::qec::stabilizer_type_from_string("X"), stabilizer_type::X);
  EXPECT_EQ(pcmgen::qec::stabilizer_type_from_string("z"), stabilizer_type::Z);
  EXPECT_EQ(pcmgen::qec::stabilizer_type_from_string("BSF"),
            stabilizer_type::BSF);
  EXPECT_THROW(pcmgen::qec::stabilizer_type_from_string("y"),
               pcmgen::qec::invalid_parameter_error);
  for (auto t : {stabilizer_type::BSF, stabilizer_type::XZ, stabilizer_type::X,
                 stabilizer_type::Z})
    EXPECT_EQ(pcmgen::qec::stabilizer_type_from_string(pcmgen::qec::to_string(t)),
              t);
}

TEST(RotatedPlanarTester, checkRegistry) {
  auto codes = pcmgen::qec::get_available_codes();
  EXPECT_TRUE(std::find(codes.begin(), codes.end(), "rotated_planar") !=
              codes.end());
  EXPECT_THROW(pcmgen::qec::get_code("hexagonal", {{"distance", 3}}),
               pcmgen::qec::invalid_parameter_error);
}

TEST(RotatedPlanarTester, checkDistanceThree) {
  // must provide distance
  EXPECT_THROW(pcmgen::qec::get_code("rotated_planar"),
               pcmgen::qec::invalid_parameter_error);

  auto code = pcmgen::qec::get_code(
      "rotated_planar", pcmgen::heterogeneous_map{{"distance", 3}});
  auto parity = code->get_parity();
  auto parity_x = code->get_parity_x();
  auto parity_z = code->get_parity_z();

  expectMatrix(
      parity,
      {{1, 1, 0, 1, 1, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
       {0, 1, 1, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
       {0, 0, 0, 0, 1, 1, 0, 1, 1, 0, 0, 0, 0, 0, 0, 0, 0, 0},
       {0, 0, 0, 0, 0, 0, 1, 1, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
       {0, 0, 0, 0, 0, 0, 0, 0, 0, 1, 0, 0, 1, 0, 0, 0, 0, 0},
       {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1, 1, 0, 1, 1, 0, 0, 0},
       {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1, 1, 0, 1, 1, 0},
       {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1, 0, 0, 1}});

  expectMatrix(parity_x, {{1, 0, 0, 1, 0, 0, 0, 0, 0},
                          {0, 1, 1, 0, 1, 1, 0, 0, 0},
                          {0, 0, 0, 1, 1, 0, 1, 1, 0},
                          {0, 0, 0, 0, 0, 1, 0, 0, 1}});

  expectMatrix(parity_z, {{1, 1, 0, 1, 1, 0, 0, 0, 0},
                          {0, 1, 1, 0, 0, 0, 0, 0, 0},
                          {0, 0, 0, 0, 1, 1, 0, 1, 1},
                          {0, 0, 0, 0, 0, 0, 1, 1, 0}});

  expectMatrix(code->get_pauli_observables_matrix(),
               {{1, 0, 0, 1, 0, 0, 1, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0},
                {0, 0, 0, 0, 0, 0, 0, 0, 0, 1, 1, 1, 0, 0, 0, 0, 0, 0}});
  expectMatrix(code->get_observables_x(), {{1, 1, 1, 0, 0, 0, 0, 0, 0}});
  expectMatrix(code->get_observables_z(), {{1, 0, 0, 1, 0, 0, 1, 0, 0}});

  EXPECT_EQ(code->get_num_data_qubits(), 9);
  EXPECT_EQ(code->get_num_ancilla_qubits(), 8);
  EXPECT_EQ(code->get_num_ancilla_x_qubits(), 4);
  EXPECT_EQ(code->get_num_ancilla_z_qubits(), 4);
  EXPECT_EQ(code->get_stabilizers().size(), 8);
}

TEST(RotatedPlanarTester, checkShapesAndWeights) {
  for (std::size_t d = 3; d <= 15; d += 2) {
    auto code = pcmgen::qec::rotated_planar::build_surface_code(d);
    const std::size_t n = d * d;
    auto parity = code->get_parity();
    EXPECT_EQ(parity.shape(), (std::vector<std::size_t>{n - 1, 2 * n}));

    auto hx = code->get_parity_x();
    auto hz = code->get_parity_z();
    EXPECT_EQ(hx.shape(), (std::vector<std::size_t>{(n - 1) / 2, n}));
    EXPECT_EQ(hz.shape(), (std::vector<std::size_t>{(n - 1) / 2, n}));

    for (auto &row : rowSupports(parity))
      EXPECT_TRUE(row.size() == 2 || row.size() == 4) << "distance " << d;

    // Z rows use only the first half of the columns, X rows the second.
    auto rows = rowSupports(parity);
    for (std::size_t r = 0; r < rows.size(); r++) {
      bool zRow = r < (n - 1) / 2;
      for (auto c : rows[r])
        EXPECT_EQ(zRow, c < n) << "distance " << d << " row " << r;
    }
  }
}

TEST(RotatedPlanarTester, checkStabilizersCommute) {
  for (std::size_t d = 3; d <= 15; d += 2) {
    auto code = pcmgen::qec::rotated_planar::build_surface_code(d);
    auto hx = code->get_parity_x();
    auto hz = code->get_parity_z();
    auto product = hx.dot(hz.transpose()) % 2;
    EXPECT_FALSE(product.any()) << "distance " << d;
  }
}

TEST(RotatedPlanarTester, checkLogicalObservables) {
  for (std::size_t d = 3; d <= 9; d += 2) {
    auto code = pcmgen::qec::rotated_planar::build_surface_code(d);
    auto lx = code->get_observables_x();
    auto lz = code->get_observables_z();
    EXPECT_FALSE((lx.dot(code->get_parity_z().transpose()) % 2).any());
    EXPECT_FALSE((lz.dot(code->get_parity_x().transpose()) % 2).any());
    auto overlap = lx.dot(lz.transpose()) % 2;
    EXPECT_EQ(overlap.at({0, 0}), 1);
    EXPECT_EQ(lx.sum_all(), d);
    EXPECT_EQ(lz.sum_all(), d);
  }
}

TEST(RotatedPlanarTester, checkDeterministic) {
  auto a = pcmgen::qec::rotated_planar::build_surface_code(7);
  auto b = pcmgen::qec::rotated_planar::build_surface_code(7);
  EXPECT_TRUE(a->get_parity() == b->get_parity());
}

TEST(RotatedPlanarTester, checkInvalidDistances) {
  using pcmgen::qec::invalid_parameter_error;
  for (std::size_t d : {0, 1, 2, 4, 6, 16})
    EXPECT_THROW(pcmgen::qec::rotated_planar::build_surface_code(d),
                 invalid_parameter_error)
        << "distance " << d;

  EXPECT_THROW(pcmgen::qec::get_code("rotated_planar", {{"distance", -3}}),
               invalid_parameter_error);
  EXPECT_THROW(pcmgen::qec::get_code("rotated_planar", {{"distance", 3.0}}),
               invalid_parameter_error);
  EXPECT_THROW(pcmgen::qec::get_code("rotated_planar", {{"distance", "3"}}),
               invalid_parameter_error);
  EXPECT_THROW(pcmgen::qec::get_code("rotated_planar", {{"rounds", 3}}),
               invalid_parameter_error);

  try {
    pcmgen::qec::rotated_planar::build_surface_code(4);
    FAIL() << "expected invalid_parameter_error";
  } catch (const invalid_parameter_error &e) {
    EXPECT_EQ(std::string(e.what()),
              "[rotated_planar] distance must be an odd integer >= 3 (got 4).");
  }
}

TEST(RotatedPlanarTester, checkDistanceOptionTypes) {
  for (auto options : {pcmgen::heterogeneous_map{{"distance", 5}},
                       pcmgen::heterogeneous_map{{"distance", std::size_t(5)}},
                       pcmgen::heterogeneous_map{{"distance", 5L}},
                       pcmgen::heterogeneous_map{{"distance", 5u}}}) {
    auto code = pcmgen::qec::get_code("rotated_planar", options);
    EXPECT_EQ(code->get_num_data_qubits(), 25);
  }
}

TEST(RotatedPlanarTester, checkStabilizerGrid) {
  {
    pcmgen::qec::rotated_planar::stabilizer_grid grid(3);

    EXPECT_EQ(3, grid.distance);
    EXPECT_EQ(4, grid.grid_length);
    EXPECT_EQ(16, grid.roles.size());
    EXPECT_EQ(4, grid.x_stab_coords.size());
    EXPECT_EQ(4, grid.z_stab_coords.size());
    EXPECT_EQ(4, grid.x_stab_indices.size());
    EXPECT_EQ(4, grid.z_stab_indices.size());
    EXPECT_EQ(9, grid.data_coords.size());
    EXPECT_EQ(9, grid.data_indices.size());

    std::vector<std::vector<std::size_t>> expected_x{
        {0, 3}, {1, 2, 4, 5}, {3, 4, 6, 7}, {5, 8}};
    std::vector<std::vector<std::size_t>> expected_z{
        {1, 2}, {0, 1, 3, 4}, {4, 5, 7, 8}, {6, 7}};
    EXPECT_EQ(grid.x_stabilizers, expected_x);
    EXPECT_EQ(grid.z_stabilizers, expected_z);

    using pcmgen::qec::rotated_planar::surface_role;
    using pcmgen::qec::rotated_planar::vec2d;
    EXPECT_EQ(grid.roles[0 * 4 + 2], surface_role::amz);
    EXPECT_EQ(grid.roles[1 * 4 + 0], surface_role::amx);
    EXPECT_EQ(grid.roles[0 * 4 + 0], surface_role::empty);
    EXPECT_EQ(grid.z_stab_indices.at(vec2d(3, 1)), 3);
    EXPECT_EQ(grid.x_stab_indices.at(vec2d(2, 3)), 3);
  }
  {
    pcmgen::qec::rotated_planar::stabilizer_grid grid(5);

    EXPECT_EQ(5, grid.distance);
    EXPECT_EQ(6, grid.grid_length);
    EXPECT_EQ(36, grid.roles.size());
    EXPECT_EQ(12, grid.x_stab_coords.size());
    EXPECT_EQ(12, grid.z_stab_coords.size());
    EXPECT_EQ(25, grid.data_coords.size());
    EXPECT_EQ(12, grid.x_stabilizers.size());
    EXPECT_EQ(12, grid.z_stabilizers.size());
  }
  {
    pcmgen::qec::rotated_planar::stabilizer_grid grid(17);

    EXPECT_EQ(17, grid.distance);
    EXPECT_EQ(18, grid.grid_length);
    EXPECT_EQ(324, grid.roles.size());
    EXPECT_EQ(144, grid.x_stab_coords.size());
    EXPECT_EQ(144, grid.z_stab_coords.size());
    EXPECT_EQ(289, grid.data_coords.size());
    EXPECT_EQ(144, grid.x_stabilizers.size());
    EXPECT_EQ(144, grid.z_stabilizers.size());
  }
}

TEST(RotatedPlanarTester, checkGridPrinting) {
  pcmgen::qec::rotated_planar::stabilizer_grid grid(3);
  {
    std::ostringstream os;
    grid.print_stabilizers(os);
    EXPECT_EQ(os.str(), "s[0]: X0 X3\n"
                        "s[1]: X1 X2 X4 X5\n"
                        "s[2]: X3 X4 X6 X7\n"
                        "s[3]: X5 X8\n"
                        "s[4]: Z1 Z2\n"
                        "s[5]: Z0 Z1 Z3 Z4\n"
                        "s[6]: Z4 Z5 Z7 Z8\n"
                        "s[7]: Z6 Z7\n"
                        "\n");
  }
  {
    std::ostringstream os;
    grid.print_data_grid(os);
    EXPECT_EQ(os.str(), "d0  d1  d2  \n"
                        "d3  d4  d5  \n"
                        "d6  d7  d8  \n"
                        "\n");
  }
  {
    std::ostringstream os;
    grid.print_stabilizer_grid(os);
    auto out = os.str();
    EXPECT_EQ(out.substr(0, out.find('\n')),
              "e(0,0)  e(0,1)  Z(0,2)  e(0,3)  ");
  }
  {
    // Smoke test the remaining helpers
    std::ostringstream os;
    grid.print_stabilizer_coords(os);
    grid.print_stabilizer_indices(os);
    grid.print_stabilizer_maps(os);
    EXPECT_NE(os.str().find("amx[3] @ (2, 3)"), std::string::npos);
  }
}

TEST(RotatedPlanarTester, checkVec2dOperators) {
  using pcmgen::qec::rotated_planar::vec2d;

  vec2d v1(2, 3);
  vec2d v2(5, 7);
  vec2d v3(2, 3);
  vec2d v4(1, 3);
  vec2d v5(2, 1);

  vec2d sum = v1 + v2;
  EXPECT_EQ(sum.row, 7);
  EXPECT_EQ(sum.col, 10);

  vec2d diff = v2 - v1;
  EXPECT_EQ(diff.row, 3);
  EXPECT_EQ(diff.col, 4);

  EXPECT_TRUE(v1 == v3);
  EXPECT_FALSE(v1 == v2);

  EXPECT_TRUE(v4 < v1);
  EXPECT_TRUE(v5 < v1);
  EXPECT_FALSE(v1 < v3);
  EXPECT_FALSE(v2 < v1);

  std::map<vec2d, int> coord_map{{v2, 2}, {v1, 1}, {v4, 4}, {v5, 5}};
  std::vector<int> order;
  for (auto &[coord, value] : coord_map)
    order.push_back(value);
  EXPECT_EQ(order, (std::vector<int>{4, 5, 1, 2}));
}
