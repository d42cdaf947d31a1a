/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace vigil::log {

  /**
   * Logging configuration with the embedded group tree of the validator.
   * A user supplied YAML (string or file) replaces the embedded one.
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
   public:
    Configurator();

    explicit Configurator(std::string config);

    explicit Configurator(std::filesystem::path path);
  };

}  // namespace vigil::log
