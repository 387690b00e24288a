/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 - 2025 NVIDIA Corporation & Affiliates.                  *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "pcmgen/qec/generator.h"
#include "pcmgen/qec/errors.h"
#include "pcmgen/qec/pcm_io.h"

#include "common/Logger.h"

namespace pcmgen::qec {

pcmgen::tensor<uint8_t> extract_matrix(const code &c, stabilizer_type type) {
  switch (type) {
  case stabilizer_type::X:
    return c.get_parity_x();
  case stabilizer_type::Z:
    return c.get_parity_z();
  case stabilizer_type::XZ:
    return c.get_parity();
  case stabilizer_type::BSF:
    break;
  }
  return c.get_parity_bsf();
}

code_builder registry_builder(const std::string &name) {
  return [name](std::size_t distance) {
    return get_code(name, {{"distance", distance}});
  };
}

generator::generator(config::generator_config config)
    : m_config(std::move(config)), m_builder(registry_builder(m_config.code)) {}

generator::generator(config::generator_config config, code_builder builder)
    : m_config(std::move(config)), m_builder(std::move(builder)) {
  if (!m_builder)
    throw invalid_parameter_error("[generator] code builder must be callable.");
}

std::string generator::run_one(std::size_t distance) const {
  auto c = m_builder(distance);
  if (!c)
    throw invalid_parameter_error(
        "[generator] code builder returned no code for distance " +
        std::to_string(distance) + ".");

  auto matrix = extract_matrix(*c, m_config.get_parity_type());
  auto path =
      pcm_output_path(m_config.output_dir, distance, m_config.file_prefix);

  csv_options options;
  options.delimiter = m_config.get_delimiter();
  options.create_directories = m_config.create_directories;
  write_matrix_csv(matrix, path, options);
  return path;
}

std::vector<std::string> generator::run() const {
  m_config.validate();
  CUDAQ_INFO("generating {} parity-check matrices ({} layout) into '{}'",
             m_config.distances.size(), m_config.parity_type,
             m_config.output_dir);

  std::vector<std::string> written;
  for (auto d : m_config.distances) {
    CUDAQ_DBG("generator: distance {}", d);
    written.push_back(run_one(d));
  }
  return written;
}

} // namespace pcmgen::qec
