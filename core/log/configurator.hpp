/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace sss::log {

  /**
   * YAML configurator of the logging system. Without an explicit config it
   * uses the embedded one: a console sink and the group tree of the library
   * (main -> sss -> codec, parser)
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
    using PrevConfigurator = soralog::Configurator;

   public:
    Configurator();

    explicit Configurator(std::string config);

    explicit Configurator(std::filesystem::path path);

    explicit Configurator(std::shared_ptr<PrevConfigurator> previous);

    Configurator(std::shared_ptr<PrevConfigurator> previous,
                 std::string config);
  };

}  // namespace sss::log
