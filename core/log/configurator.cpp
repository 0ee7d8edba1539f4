/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/configurator.hpp"

namespace sss::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::string embedded_config(R"(
# ----------------
sinks:
  - name: console
    type: console
    stream: stderr
    thread: none
    color: false
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: sss
        children:
          - name: codec
          - name: parser
      - name: others
        children:
          - name: testing
# ----------------
  )");
  }  // namespace

  Configurator::Configurator() : ConfiguratorFromYAML(embedded_config) {}

  Configurator::Configurator(std::string config)
      : ConfiguratorFromYAML(std::move(config)) {}

  Configurator::Configurator(std::filesystem::path path)
      : ConfiguratorFromYAML(std::move(path)) {}

  Configurator::Configurator(std::shared_ptr<PrevConfigurator> previous)
      : ConfiguratorFromYAML(std::move(previous), embedded_config) {}

  Configurator::Configurator(std::shared_ptr<PrevConfigurator> previous,
                             std::string config)
      : ConfiguratorFromYAML(std::move(previous), std::move(config)) {}

}  // namespace sss::log
