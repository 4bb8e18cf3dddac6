/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <soralog/impl/configurator_from_yaml.hpp>

#include "filesystem/common.hpp"

namespace lapphost::log {

  /**
   * soralog configurator: the embedded YAML with the lapphost group tree,
   * or a user supplied config (string content or file path)
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
   public:
    Configurator();

    explicit Configurator(std::string config);

    explicit Configurator(filesystem::path path);

    /// Looks for `--logcfg <path>` among command line arguments
    static std::optional<filesystem::path> getLogConfigFile(int argc,
                                                            const char **argv);
  };

}  // namespace lapphost::log
