/*******************************************************************************
 * Copyright (c) 2024 - 2025 NVIDIA Corporation & Affiliates.                  *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/

// Writes the parity-check matrix of the rotated planar surface code for each
// configured distance.
//
//   pcmgen                 # distances 3..15 into ./pcm_matrices
//   pcmgen config.yaml     # settings from a YAML file

#include "pcmgen/qec/generator.h"

#include "common/Logger.h"

#include <cstdio>
#include <exception>
#include <string>

static void show_help() {
  printf("Usage: pcmgen [options] [config.yaml]\n");
  printf("\n");
  printf("Write the parity-check matrix of the rotated planar surface code\n");
  printf("for each configured distance as a comma-delimited text file.\n");
  printf("\n");
  printf("Without a config file the defaults are used: distances 3, 5, ...,\n");
  printf("15 written to pcm_matrices/distance_<d>_surface_code.csv.\n");
  printf("\n");
  printf("Config keys: code, distances, output_dir, file_prefix,\n");
  printf("             parity_type (bsf|xz|x|z), create_directories, delimiter\n");
  printf("\n");
  printf("Options:\n");
  printf("  -h, --help     Show this help message\n");
}

int main(int argc, char **argv) {
  std::string config_file;
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      show_help();
      return 0;
    } else if (!arg.empty() && arg[0] == '-') {
      fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
      show_help();
      return 1;
    } else if (!config_file.empty()) {
      fprintf(stderr, "Only one config file may be given.\n");
      return 1;
    } else {
      config_file = arg;
    }
  }

  try {
    auto config = config_file.empty()
                      ? pcmgen::qec::config::generator_config()
                      : pcmgen::qec::config::generator_config::from_yaml_file(
                            config_file);
    pcmgen::qec::generator gen(config);
    auto written = gen.run();
    CUDAQ_INFO("pcmgen: wrote {} file(s)", written.size());
    for (auto &path : written)
      printf("%s\n", path.c_str());
  } catch (const std::exception &e) {
    CUDAQ_WARN("pcmgen failed: {}", e.what());
    fprintf(stderr, "pcmgen: %s\n", e.what());
    return 1;
  }

  return 0;
}
