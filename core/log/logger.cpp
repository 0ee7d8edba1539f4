/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <array>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <boost/throw_exception.hpp>

#include "log/configurator.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(sss::log, Error, e) {
  using E = sss::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
    case E::WRONG_GROUP:
      return "Unknown group";
    case E::WRONG_TUNING:
      return "Expected 'level' or 'group=level'";
  }
  return "Unknown log::Error";
}

namespace sss::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::mutex logging_system_mutex;
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::weak_ptr<soralog::LoggingSystem> installed_logging_system;
    // owns the system created when nobody installed one
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::shared_ptr<soralog::LoggingSystem> default_logging_system;

    const std::array<std::pair<std::string_view, Level>, 14> kLevelNames{{
        {"trace", Level::TRACE},
        {"debug", Level::DEBUG},
        {"verbose", Level::VERBOSE},
        {"info", Level::INFO},
        {"inf", Level::INFO},
        {"warning", Level::WARN},
        {"warn", Level::WARN},
        {"error", Level::ERROR},
        {"err", Level::ERROR},
        {"critical", Level::CRITICAL},
        {"crit", Level::CRITICAL},
        {"off", Level::OFF},
        {"no", Level::OFF},
        {"none", Level::OFF},
    }};

    std::shared_ptr<soralog::LoggingSystem> loggingSystem() {
      std::lock_guard lock(logging_system_mutex);
      if (auto logging_system = installed_logging_system.lock()) {
        return logging_system;
      }

      auto logging_system = std::make_shared<soralog::LoggingSystem>(
          std::make_shared<Configurator>());
      auto r = logging_system->configure();
      if (r.has_error) {
        boost::throw_exception(std::runtime_error(
            "Can't configure default logging system: " + r.message));
      }
      default_logging_system = logging_system;
      installed_logging_system = logging_system;
      return logging_system;
    }

    std::shared_ptr<soralog::LoggerFactory> loggerFactory() {
      return std::static_pointer_cast<soralog::LoggerFactory>(loggingSystem());
    }
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    for (const auto &[name, level] : kLevelNames) {
      if (name == str) {
        return level;
      }
    }
    return Error::WRONG_LEVEL;
  }

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system) {
    std::lock_guard lock(logging_system_mutex);
    installed_logging_system = std::move(logging_system);
    default_logging_system.reset();
  }

  outcome::result<void> tuneLoggingSystem(
      const std::vector<std::string> &cfg) {
    auto logging_system = loggingSystem();

    for (std::string_view chunk : cfg) {
      auto eq = chunk.find('=');
      if (eq == std::string_view::npos) {
        OUTCOME_TRY(level, str2lvl(chunk));
        logging_system->setLevelOfGroup(defaultGroupName, level);
        continue;
      }

      auto group = chunk.substr(0, eq);
      if (group.empty() or chunk.find('=', eq + 1) != std::string_view::npos) {
        return Error::WRONG_TUNING;
      }
      OUTCOME_TRY(level, str2lvl(chunk.substr(eq + 1)));
      if (not logging_system->setLevelOfGroup(std::string{group}, level)) {
        return Error::WRONG_GROUP;
      }
    }
    return outcome::success();
  }

  Logger createLogger(const std::string &tag) {
    return loggerFactory()->getLogger(tag, defaultGroupName);
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    return loggerFactory()->getLogger(tag, group);
  }

  Logger createLogger(const std::string &tag,
                      const std::string &group,
                      Level level) {
    return loggerFactory()->getLogger(tag, group, level);
  }

  bool setLevelOfGroup(const std::string &group_name, Level level) {
    return loggingSystem()->setLevelOfGroup(group_name, level);
  }

  bool resetLevelOfGroup(const std::string &group_name) {
    return loggingSystem()->resetLevelOfGroup(group_name);
  }

  bool setLevelOfLogger(const std::string &logger_name, Level level) {
    return loggingSystem()->setLevelOfLogger(logger_name, level);
  }

  bool resetLevelOfLogger(const std::string &logger_name) {
    return loggingSystem()->resetLevelOfLogger(logger_name);
  }

}  // namespace sss::log
