/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "filesystem/common.hpp"

namespace lapphost::application {

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    /**
     * @return directory with one subdirectory per lapp
     */
    virtual const filesystem::path &lappsDir() const = 0;

    /**
     * @return number of threads of the worker pool
     */
    virtual size_t threads() const = 0;

    /**
     * @return how long an operation waits for a lapp lock,
     * std::nullopt to wait forever
     */
    virtual std::optional<std::chrono::milliseconds> lockTimeout() const = 0;

    /**
     * @return how long unload waits for a lapp service to stop
     */
    virtual std::chrono::milliseconds serviceStopTimeout() const = 0;

    /**
     * @return default timeout of outbound http requests of lapps
     */
    virtual std::chrono::milliseconds httpTimeout() const = 0;

    /**
     * @return logger levels tuning, see log::tuneLoggingSystem
     */
    virtual const std::vector<std::string> &log() const = 0;
  };

}  // namespace lapphost::application
