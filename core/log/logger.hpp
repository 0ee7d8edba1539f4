/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

#include "outcome/outcome.hpp"

namespace sss::log {

  using Level = soralog::Level;
  using Logger = std::shared_ptr<soralog::Logger>;

  enum class Error : uint8_t {
    WRONG_LEVEL = 1,  ///< level name is not known
    WRONG_GROUP,      ///< group is not in the logging system
    WRONG_TUNING,     ///< chunk is neither "level" nor "group=level"
  };

  outcome::result<Level> str2lvl(std::string_view str);

  /**
   * Installs the logging system used by createLogger().
   * If it was never called, the first createLogger() installs a logging
   * system configured by log::Configurator with its embedded config
   */
  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system);

  /**
   * Applies level overrides, each chunk is either a level for the default
   * group ("debug") or a group assignment ("codec=trace").
   * Chunks before a bad one stay applied
   */
  outcome::result<void> tuneLoggingSystem(const std::vector<std::string> &cfg);

  static const std::string defaultGroupName("sss");

  [[nodiscard]] Logger createLogger(const std::string &tag);

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group);

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group,
                                    Level level);

  bool setLevelOfGroup(const std::string &group_name, Level level);
  bool resetLevelOfGroup(const std::string &group_name);

  bool setLevelOfLogger(const std::string &logger_name, Level level);
  bool resetLevelOfLogger(const std::string &logger_name);

}  // namespace sss::log

OUTCOME_HPP_DECLARE_ERROR(sss::log, Error)
