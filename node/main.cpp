/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>

#include <soralog/logging_system.hpp>
#include <soralog/util.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "application/impl/lapphost_application_impl.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"

using lapphost::application::AppConfigurationImpl;
using lapphost::application::LapphostApplicationImpl;

int main(int argc, const char **argv) {
  setvbuf(stdout, nullptr, _IOLBF, 0);
  setvbuf(stderr, nullptr, _IOLBF, 0);

  soralog::util::setThreadName("lapphost");

  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        lapphost::log::Configurator::getLogConfigFile(argc, argv);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<lapphost::log::Configurator>(
                  custom_log_config_path.value())
            : std::make_shared<lapphost::log::Configurator>();

    return std::make_shared<soralog::LoggingSystem>(std::move(configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  lapphost::log::setLoggingSystem(logging_system);

  auto configuration = std::make_shared<AppConfigurationImpl>();
  if (not configuration->initializeFromArgs(argc, argv)) {
    return EXIT_FAILURE;
  }

  lapphost::log::tuneLoggingSystem(configuration->log());

  auto logger =
      lapphost::log::createLogger("Main", lapphost::log::defaultGroupName);

  int exit_code = EXIT_FAILURE;
  {
    LapphostApplicationImpl app{configuration};
    exit_code = app.run();
  }

  SL_INFO(logger, "All components are stopped");
  logger->flush();

  return exit_code;
}
