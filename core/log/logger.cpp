/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <iostream>

#include <boost/assert.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(lapphost::log, Error, e) {
  using E = lapphost::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown log level";
  }
  return "Unknown log::Error";
}

namespace lapphost::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::weak_ptr<soralog::LoggingSystem> logging_system_;

    std::shared_ptr<soralog::LoggingSystem> loggingSystem() {
      auto logging_system = logging_system_.lock();
      BOOST_ASSERT_MSG(logging_system,
                       "lapphost::log::setLoggingSystem() must be called "
                       "before any logger is created");
      return logging_system;
    }

    constexpr std::pair<std::string_view, Level> kLevels[]{
        {"trace", Level::TRACE},
        {"debug", Level::DEBUG},
        {"verbose", Level::VERBOSE},
        {"info", Level::INFO},
        {"warn", Level::WARN},
        {"warning", Level::WARN},
        {"error", Level::ERROR},
        {"critical", Level::CRITICAL},
        {"off", Level::OFF},
    };
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    for (auto &[name, level] : kLevels) {
      if (name == str) {
        return level;
      }
    }
    return Error::WRONG_LEVEL;
  }

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = std::move(logging_system);
  }

  void tuneLoggingSystem(const std::vector<std::string> &cfg) {
    auto logging_system = loggingSystem();
    for (std::string_view entry : cfg) {
      auto eq = entry.find('=');
      auto group = eq == std::string_view::npos ? std::string{defaultGroupName}
                                                : std::string{entry.substr(0, eq)};
      auto level_str =
          eq == std::string_view::npos ? entry : entry.substr(eq + 1);

      auto level = str2lvl(level_str);
      if (not level) {
        std::cerr << "Invalid log level '" << level_str << "' in '" << entry
                  << "'\n";
        continue;
      }
      if (not logging_system->setLevelOfGroup(group, level.value())) {
        std::cerr << "Unknown log group '" << group << "'\n";
      }
    }
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    return std::static_pointer_cast<soralog::LoggerFactory>(loggingSystem())
        ->getLogger(tag, group);
  }

  bool setLevelOfGroup(const std::string &group_name, Level level) {
    return loggingSystem()->setLevelOfGroup(group_name, level);
  }

}  // namespace lapphost::log
