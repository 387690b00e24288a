/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 - 2025 NVIDIA Corporation & Affiliates.                  *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "pcmgen/qec/pcm_io.h"
#include "pcmgen/qec/errors.h"

#include "common/Logger.h"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace pcmgen::qec {

namespace {

void prepare_parent_directory(const fs::path &file, const csv_options &options) {
  auto parent = file.parent_path();
  if (parent.empty())
    return;

  std::error_code ec;
  if (fs::is_directory(parent, ec))
    return;

  if (!options.create_directories)
    throw path_not_found_error(
        fmt::format("[write_matrix_csv] output directory '{}' does not exist.",
                    parent.string()));

  CUDAQ_WARN("output directory '{}' does not exist, creating it.",
             parent.string());
  fs::create_directories(parent, ec);
  if (ec)
    throw write_error(
        fmt::format("[write_matrix_csv] could not create directory '{}': {}",
                    parent.string(), ec.message()));
}

template <typename Scalar>
void write_matrix(const pcmgen::tensor<Scalar> &matrix, const std::string &path,
                  const csv_options &options) {
  if (matrix.rank() != 0 && matrix.rank() != 2)
    throw write_error(fmt::format(
        "[write_matrix_csv] expected a rank-2 matrix, got rank {}.",
        matrix.rank()));

  prepare_parent_directory(fs::path(path), options);

  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out)
    throw write_error(
        fmt::format("[write_matrix_csv] could not open '{}' for writing.", path));

  std::size_t rows = 0, cols = 0;
  if (matrix.rank() == 2) {
    rows = matrix.shape()[0];
    cols = matrix.shape()[1];
    const auto *data = matrix.data();
    std::string line;
    for (std::size_t r = 0; r < rows; r++) {
      line.clear();
      for (std::size_t c = 0; c < cols; c++) {
        if (c > 0)
          line.push_back(options.delimiter);
        // Promote so uint8_t is written as a number, not a character.
        line += std::to_string(static_cast<long long>(data[r * cols + c]));
      }
      line.push_back('\n');
      out << line;
    }
  }

  out.close();
  if (out.fail())
    throw write_error(
        fmt::format("[write_matrix_csv] failed writing '{}'.", path));

  CUDAQ_INFO("wrote {} x {} matrix to {}", rows, cols, path);
}

template <typename Scalar>
pcmgen::tensor<Scalar> read_matrix(const std::string &path, char delimiter) {
  if (!fs::exists(path))
    throw path_not_found_error(
        fmt::format("[read_matrix_csv] file '{}' does not exist.", path));

  std::ifstream in(path);
  if (!in)
    throw path_not_found_error(
        fmt::format("[read_matrix_csv] could not open '{}'.", path));

  std::vector<Scalar> values;
  std::size_t rows = 0, cols = 0;
  std::string line;
  std::size_t lineNo = 0;
  while (std::getline(in, line)) {
    lineNo++;
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.empty())
      continue;

    std::size_t fields = 0;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, delimiter)) {
      long long value = 0;
      auto [ptr, ec] =
          std::from_chars(field.data(), field.data() + field.size(), value);
      if (ec != std::errc() || ptr != field.data() + field.size() ||
          value < std::numeric_limits<Scalar>::min() ||
          value > std::numeric_limits<Scalar>::max())
        throw parse_error(fmt::format(
            "[read_matrix_csv] {}:{}: invalid matrix entry '{}'.", path,
            lineNo, field));
      values.push_back(static_cast<Scalar>(value));
      fields++;
    }
    // getline drops a trailing empty field
    if (line.back() == delimiter)
      throw parse_error(fmt::format(
          "[read_matrix_csv] {}:{}: trailing delimiter.", path, lineNo));

    if (rows == 0)
      cols = fields;
    else if (fields != cols)
      throw parse_error(fmt::format(
          "[read_matrix_csv] {}:{}: expected {} columns, found {}.", path,
          lineNo, cols, fields));
    rows++;
  }

  if (rows == 0)
    return pcmgen::tensor<Scalar>();

  pcmgen::tensor<Scalar> result({rows, cols});
  std::copy(values.begin(), values.end(), result.data());
  CUDAQ_DBG("read {} x {} matrix from {}", rows, cols, path);
  return result;
}

} // namespace

void write_matrix_csv(const pcmgen::tensor<uint8_t> &matrix,
                      const std::string &path, const csv_options &options) {
  write_matrix(matrix, path, options);
}

void write_matrix_csv(const pcmgen::tensor<int> &matrix,
                      const std::string &path, const csv_options &options) {
  write_matrix(matrix, path, options);
}

pcmgen::tensor<uint8_t> read_matrix_csv(const std::string &path,
                                        char delimiter) {
  return read_matrix<uint8_t>(path, delimiter);
}

pcmgen::tensor<int> read_int_matrix_csv(const std::string &path,
                                        char delimiter) {
  return read_matrix<int>(path, delimiter);
}

std::string pcm_output_path(const std::string &output_dir,
                            std::size_t distance, const std::string &prefix) {
  auto file = fmt::format("{}distance_{}_surface_code.csv", prefix, distance);
  if (output_dir.empty())
    return file;
  return (fs::path(output_dir) / file).string();
}

} // namespace pcmgen::qec
