/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "filesystem/common.hpp"
#include "lapps/capabilities.hpp"
#include "outcome/outcome.hpp"

namespace lapphost::lapps {

  enum class SettingsError {
    READ_FAILED = 1,
    PARSE_FAILED,
    INVALID_VALUE,
    WRITE_FAILED,
  };

  struct ApplicationSettings {
    std::string title;
    bool enabled = false;

    bool operator==(const ApplicationSettings &) const = default;
  };

  struct DatabaseSettings {
    /// relative to the lapp root unless absolute
    std::string path;

    bool operator==(const DatabaseSettings &) const = default;
  };

  /**
   * Restrictions of outbound requests of a lapp.
   * std::nullopt lists mean "all".
   */
  struct HttpSettings {
    std::optional<std::set<std::string>> methods;
    std::optional<std::set<std::string>> hosts;
    std::optional<std::chrono::milliseconds> timeout;

    bool isMethodAllowed(std::string_view method) const;
    bool isHostAllowed(std::string_view host) const;

    bool operator==(const HttpSettings &) const = default;
  };

  struct GossipsubSettings {
    std::string addr;
    std::vector<uint16_t> dial_ports;

    bool operator==(const GossipsubSettings &) const = default;
  };

  struct NetworkSettings {
    HttpSettings http;
    GossipsubSettings gossipsub;

    bool operator==(const NetworkSettings &) const = default;
  };

  /**
   * Persistent settings of a lapp, `<root>/settings.json`
   */
  struct LappSettings {
    ApplicationSettings application;
    Capabilities permissions;
    DatabaseSettings database;
    NetworkSettings network;

    static constexpr std::string_view kFileName = "settings.json";

    /**
     * Parses settings json, missing fields take default values.
     * Unknown permissions and allowed permissions that are not required
     * are dropped with a warning.
     */
    static outcome::result<LappSettings> parse(std::string_view json);

    static outcome::result<LappSettings> load(const filesystem::path &path);

    std::string toJson() const;

    outcome::result<void> save(const filesystem::path &path) const;

    bool operator==(const LappSettings &) const = default;
  };

}  // namespace lapphost::lapps

OUTCOME_HPP_DECLARE_ERROR(lapphost::lapps, SettingsError);
