/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <stdexcept>

#include <soralog/impl/configurator_from_yaml.hpp>

#include "log/configurator.hpp"
#include "log/logger.hpp"

namespace testutil {

  static std::once_flag initialized;
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  static std::shared_ptr<soralog::LoggingSystem> testing_logging_system;

  // supposed to be called in SetUpTestCase
  inline void prepareLoggers(soralog::Level level = soralog::Level::INFO) {
    std::call_once(initialized, [] {
      auto testing_log_config = std::string(R"(
sinks:
  - name: console
    type: console
    capacity: 4
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
      - name: testing
        level: trace
)");

      testing_logging_system = std::make_shared<soralog::LoggingSystem>(
          std::make_shared<sss::log::Configurator>(testing_log_config));
      auto r = testing_logging_system->configure();
      if (r.has_error) {
        throw std::runtime_error("Can't configure logger system: " + r.message);
      }

      sss::log::setLoggingSystem(testing_logging_system);
    });

    sss::log::setLevelOfGroup(sss::log::defaultGroupName, level);
  }
}  // namespace testutil
