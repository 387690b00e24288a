/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 - 2025 NVIDIA Corporation & Affiliates.                  *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/

#include "common/Logger.h"
#include "llvm/Support/YAMLTraits.h"
#include "llvm/Support/raw_ostream.h"
#include "pcmgen/qec/errors.h"
#include "pcmgen/qec/generator_config.h"
#include <cctype>
#include <filesystem>
#include <fstream>

namespace pcmgen::qec::config {

#define INSERT_ARG(arg_name)                                                   \
  do {                                                                         \
    config_map.insert(#arg_name, this->arg_name);                              \
  } while (false)

#define GET_ARG(arg_name)                                                      \
  do {                                                                         \
    if (map.contains(#arg_name)) {                                             \
      config.arg_name =                                                        \
          map.get<std::decay_t<decltype(config.arg_name)>>(#arg_name);         \
    }                                                                          \
  } while (false)

pcmgen::heterogeneous_map generator_config::to_heterogeneous_map() const {
  pcmgen::heterogeneous_map config_map;

  INSERT_ARG(code);
  INSERT_ARG(distances);
  INSERT_ARG(output_dir);
  INSERT_ARG(file_prefix);
  INSERT_ARG(parity_type);
  INSERT_ARG(create_directories);
  INSERT_ARG(delimiter);

  return config_map;
}

generator_config
generator_config::from_heterogeneous_map(const pcmgen::heterogeneous_map &map) {
  generator_config config;

  GET_ARG(code);
  GET_ARG(output_dir);
  GET_ARG(file_prefix);
  GET_ARG(parity_type);
  GET_ARG(create_directories);
  GET_ARG(delimiter);

  // Distances are commonly written as a list of plain ints.
  if (map.contains("distances")) {
    try {
      config.distances = map.get<std::vector<std::size_t>>("distances");
    } catch (const std::runtime_error &) {
      std::vector<int> ints;
      try {
        ints = map.get<std::vector<int>>("distances");
      } catch (const std::runtime_error &e) {
        throw invalid_parameter_error(
            std::string("[generator_config] distances must be a list of "
                        "integers: ") +
            e.what());
      }
      config.distances.clear();
      for (auto d : ints) {
        if (d < 0)
          throw invalid_parameter_error(
              "[generator_config] distances must be non-negative.");
        config.distances.push_back(static_cast<std::size_t>(d));
      }
    }
  }

  return config;
}

#undef INSERT_ARG
#undef GET_ARG

void generator_config::validate() const {
  if (code.empty())
    throw invalid_parameter_error("[generator_config] code must not be empty.");
  if (distances.empty())
    throw invalid_parameter_error(
        "[generator_config] distances must contain at least one entry.");
  // throws on an unknown name
  get_parity_type();
  get_delimiter();
}

stabilizer_type generator_config::get_parity_type() const {
  return stabilizer_type_from_string(parity_type);
}

char generator_config::get_delimiter() const {
  if (delimiter.size() != 1 ||
      std::isdigit(static_cast<unsigned char>(delimiter[0])) ||
      delimiter[0] == '\n' || delimiter[0] == '\r')
    throw invalid_parameter_error(
        "[generator_config] delimiter must be a single non-digit character "
        "(got '" +
        delimiter + "').");
  return delimiter[0];
}

} // namespace pcmgen::qec::config

namespace llvm::yaml {

template <>
struct MappingTraits<pcmgen::qec::config::generator_config> {
  static void mapping(IO &io, pcmgen::qec::config::generator_config &config) {
    io.mapOptional("code", config.code);
    io.mapOptional("distances", config.distances);
    io.mapOptional("output_dir", config.output_dir);
    io.mapOptional("file_prefix", config.file_prefix);
    io.mapOptional("parity_type", config.parity_type);
    io.mapOptional("create_directories", config.create_directories);
    io.mapOptional("delimiter", config.delimiter);
  }
};

} // namespace llvm::yaml

namespace pcmgen::qec::config {

generator_config generator_config::from_yaml_str(const std::string &yaml_str) {
  generator_config config;
  llvm::yaml::Input yaml_in(yaml_str);
  yaml_in >> config;
  if (yaml_in.error())
    throw parse_error("[generator_config] invalid YAML configuration: " +
                      yaml_in.error().message());
  return config;
}

std::string generator_config::to_yaml_str(int column_wrap) {
  std::string yaml_str;
  llvm::raw_string_ostream yaml_stream(yaml_str);
  llvm::yaml::Output yaml_out(yaml_stream, nullptr, column_wrap);
  yaml_out << *this;
  yaml_stream.flush();
  return yaml_str;
}

generator_config generator_config::from_yaml_file(const std::string &path) {
  CUDAQ_INFO("Loading generator config file: {}", path);

  if (!std::filesystem::exists(path)) {
    CUDAQ_WARN("Config file does not exist: {}", path);
    throw path_not_found_error("[generator_config] config file '" + path +
                               "' does not exist.");
  }

  std::ifstream config_file_stream(path);
  std::string config_str((std::istreambuf_iterator<char>(config_file_stream)),
                         std::istreambuf_iterator<char>());
  return from_yaml_str(config_str);
}

} // namespace pcmgen::qec::config
