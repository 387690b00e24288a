/*******************************************************************************
 * Copyright (c) 2024 - 2025 NVIDIA Corporation & Affiliates.                  *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "pcmgen/qec/stabilizer_utils.h"
#include "pcmgen/qec/errors.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace pcmgen::qec {
// Z-type operators sort before X-type ones; within a type an earlier first
// occurrence is "less".
// Example: a = "ZZI", b = "IZZ" -> a < b, and "IIZ" < "XXI"
static bool spinOpComparatorStr(const std::string &astr,
                                const std::string &bstr) {
  auto zIdxA = astr.find_first_of('Z');
  auto zIdxB = bstr.find_first_of('Z');
  if (zIdxA == std::string::npos) {
    if (zIdxB != std::string::npos)
      return false;

    return astr.find_first_of('X') < bstr.find_first_of('X');
  }

  if (zIdxB == std::string::npos)
    return true;

  return zIdxA < zIdxB;
}

// Number of qubits a term spans, counting the identities below its highest
// target.
static std::size_t termWidth(const cudaq::spin_op_term &op) {
  std::size_t width = 0;
  for (auto degree : op.degrees())
    width = std::max(width, degree + 1);
  return std::max(width, op.get_pauli_word().size());
}

static std::string pauliWord(const cudaq::spin_op_term &op,
                             std::size_t numQubits) {
  auto word = op.get_pauli_word(numQubits);
  // Trailing identities are not guaranteed to be materialized.
  if (word.size() < numQubits)
    word.resize(numQubits, 'I');
  return word;
}

void sortStabilizerOps(std::vector<cudaq::spin_op_term> &ops) {
  std::size_t numQubits = 0;
  for (auto &op : ops)
    numQubits = std::max(numQubits, termWidth(op));

  // Compare full-width words so that positions line up across terms.
  std::vector<std::pair<std::string, cudaq::spin_op_term>> keyed;
  keyed.reserve(ops.size());
  for (auto &op : ops) {
    auto word = pauliWord(op, numQubits);
    keyed.emplace_back(std::move(word), std::move(op));
  }
  std::stable_sort(keyed.begin(), keyed.end(),
                   [](const auto &a, const auto &b) {
                     return spinOpComparatorStr(a.first, b.first);
                   });

  ops.clear();
  for (auto &[word, op] : keyed)
    ops.push_back(std::move(op));
}

static std::size_t countZRows(const std::vector<std::string> &sorted) {
  std::size_t numZRows = 0;
  for (const auto &word : sorted) {
    if (word.find('Z') == std::string::npos)
      break;
    numZRows++;
  }
  return numZRows;
}

// Fill rows [firstRow, firstRow + numRows) of `words` into `t`, starting at
// row `dstRow` and column offset `colOffset`, marking positions holding
// `pauli`.
static void fillBlock(pcmgen::tensor<uint8_t> &t,
                      const std::vector<std::string> &words,
                      std::size_t firstRow, std::size_t numRows,
                      std::size_t dstRow, std::size_t colOffset, char pauli) {
  for (std::size_t row = 0; row < numRows; row++) {
    const auto &word = words[firstRow + row];
    for (std::size_t q = 0; q < word.size(); q++)
      if (word[q] == pauli)
        t.at({dstRow + row, colOffset + q}) = 1;
  }
}

static pcmgen::tensor<uint8_t>
wordsToParityMatrix(std::vector<std::string> words, stabilizer_type type,
                    std::size_t numQubits) {
  if (words.empty())
    return pcmgen::tensor<uint8_t>();

  for (auto &word : words)
    if (word.size() < numQubits)
      word.resize(numQubits, 'I');
  std::sort(words.begin(), words.end(), spinOpComparatorStr);

  const auto numStabilizers = words.size();
  const auto numZRows = countZRows(words);
  const auto numXRows = numStabilizers - numZRows;

  switch (type) {
  case stabilizer_type::XZ: {
    pcmgen::tensor<uint8_t> t({numStabilizers, 2 * numQubits});
    fillBlock(t, words, 0, numZRows, 0, 0, 'Z');
    fillBlock(t, words, numZRows, numXRows, numZRows, numQubits, 'X');
    return t;
  }
  case stabilizer_type::BSF: {
    pcmgen::tensor<uint8_t> t({numStabilizers, 2 * numQubits});
    fillBlock(t, words, 0, numZRows, 0, numQubits, 'Z');
    fillBlock(t, words, numZRows, numXRows, numZRows, 0, 'X');
    return t;
  }
  case stabilizer_type::Z: {
    if (numZRows == 0)
      return pcmgen::tensor<uint8_t>();
    pcmgen::tensor<uint8_t> t({numZRows, numQubits});
    fillBlock(t, words, 0, numZRows, 0, 0, 'Z');
    return t;
  }
  case stabilizer_type::X: {
    if (numXRows == 0)
      return pcmgen::tensor<uint8_t>();
    pcmgen::tensor<uint8_t> t({numXRows, numQubits});
    fillBlock(t, words, numZRows, numXRows, 0, 0, 'X');
    return t;
  }
  }

  throw invalid_parameter_error("[to_parity_matrix] unknown stabilizer type.");
}

pcmgen::tensor<uint8_t>
to_parity_matrix(const std::vector<cudaq::spin_op_term> &stabilizers,
                 stabilizer_type type, std::size_t num_qubits) {
  if (num_qubits == 0)
    for (auto &s : stabilizers)
      num_qubits = std::max(num_qubits, termWidth(s));

  std::vector<std::string> words;
  words.reserve(stabilizers.size());
  for (auto &s : stabilizers)
    words.emplace_back(pauliWord(s, num_qubits));
  return wordsToParityMatrix(std::move(words), type, num_qubits);
}

pcmgen::tensor<uint8_t> to_parity_matrix(const std::vector<std::string> &words,
                                         stabilizer_type type) {
  std::size_t numQubits = 0;
  for (auto &w : words) {
    if (w.find_first_not_of("IXZ") != std::string::npos)
      throw invalid_parameter_error(
          "[to_parity_matrix] stabilizers must be pure X or Z Pauli words (got " +
          w + ").");
    numQubits = std::max(numQubits, w.size());
  }
  return wordsToParityMatrix(words, type, numQubits);
}

stabilizer_type stabilizer_type_from_string(const std::string &name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "bsf")
    return stabilizer_type::BSF;
  if (lower == "xz")
    return stabilizer_type::XZ;
  if (lower == "x")
    return stabilizer_type::X;
  if (lower == "z")
    return stabilizer_type::Z;
  throw invalid_parameter_error(
      "[stabilizer_type] parity type must be one of bsf, xz, x or z (got '" + name +
      "').");
}

std::string to_string(stabilizer_type type) {
  switch (type) {
  case stabilizer_type::BSF:
    return "bsf";
  case stabilizer_type::XZ:
    return "xz";
  case stabilizer_type::X:
    return "x";
  case stabilizer_type::Z:
    return "z";
  }
  return "xz";
}

} // namespace pcmgen::qec
