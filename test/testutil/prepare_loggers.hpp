/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>

#include <soralog/impl/configurator_from_yaml.hpp>

#include "log/configurator.hpp"
#include "log/logger.hpp"

namespace testutil {

  static std::once_flag initialized;

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
      - name: lapphost
        children:
          - name: application
          - name: threads
          - name: lapps
            children:
              - name: lapps_manager
              - name: lapp_service
          - name: runtime
            children:
              - name: wasm_edge
              - name: memory
          - name: host_api
            children:
              - name: database_extension
              - name: http_extension
              - name: sleep_extension
          - name: http
      - name: testing
        level: trace
)");

      auto logging_system = std::make_shared<soralog::LoggingSystem>(
          std::make_shared<lapphost::log::Configurator>(testing_log_config));
      auto r = logging_system->configure();
      if (r.has_error) {
        throw std::runtime_error("Can't configure logger system: " + r.message);
      }

      lapphost::log::setLoggingSystem(logging_system);
    });

    lapphost::log::setLevelOfGroup(lapphost::log::defaultGroupName, level);
  }
}  // namespace testutil
