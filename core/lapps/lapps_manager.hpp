/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "lapps/lapp.hpp"
#include "log/logger.hpp"

namespace lapphost::lapps {

  /**
   * Summary of a lapp for the admin surface
   */
  struct LappInfo {
    std::string name;
    std::string title;
    bool enabled = false;
    std::set<Permission> required_permissions;
    std::set<Permission> allowed_permissions;
    bool loaded = false;
    bool service_running = false;

    bool operator==(const LappInfo &) const = default;
  };

  /**
   * Registry of the lapps of the node.
   *
   * Every lapp is locked independently: exclusive access for load, unload
   * and update, shared access for dispatch and inspection. With a lock
   * timeout configured, an operation that can't take the lock in time
   * fails with LappError::LOCK_UNAVAILABLE.
   */
  class LappsManager {
   public:
    struct Config {
      filesystem::path lapps_dir;
      std::optional<std::chrono::milliseconds> lock_timeout;
      std::chrono::milliseconds service_stop_timeout{5000};
    };

    LappsManager(Config config,
                 std::shared_ptr<const LappLoader> loader,
                 std::shared_ptr<boost::asio::io_context> io_context);

    const Config &config() const {
      return config_;
    }

    /**
     * Registers a lapp for every subdirectory of the lapps directory
     * @return number of lapps found
     */
    outcome::result<size_t> discover();

    /// Registers lapp `name` rooted at `<lapps_dir>/<name>`
    void insertLapp(const std::string &name);

    /// For a lapp whose settings are already known
    void insertLapp(const std::string &name, LappSettings settings);

    outcome::result<std::shared_ptr<SharedLapp>> lapp(
        const std::string &name) const;

    std::vector<std::string> lappNames() const;

    /// Loads every enabled lapp except the main one, failures are logged
    void loadLapps();

    LoadOutcome<void> load(const std::string &name);

    /**
     * Drops the instance of the lapp, then stops its service and waits
     * for it, the lapp lock is not held while waiting
     */
    outcome::result<void> unload(const std::string &name);

    void unloadAll();

    outcome::result<UpdateQuery> update(const std::string &name,
                                        const UpdateQuery &query);

    outcome::result<http::Response> processHttp(const std::string &name,
                                                const http::Request &request);

    /// Endpoint of the lapp service, spawned on first use
    outcome::result<ServiceSender> runServiceIfNeeded(const std::string &name);

    /**
     * Stops the lapp service and waits for it
     * @return false if the service was never started or did not confirm
     */
    outcome::result<bool> stopService(const std::string &name);

    /// Routes `message` to the lapp through its service
    outcome::result<void> deliver(const std::string &name, Buffer message);

    std::vector<LappInfo> lappsInfo() const;

   private:
    /// `f` returns a result, LOCK_UNAVAILABLE is reported through it
    template <typename F>
    auto exclusive(SharedLapp &lapp, F &&f) const
        -> std::invoke_result_t<F, Lapp &>;

    template <typename F>
    auto shared(const SharedLapp &lapp, F &&f) const
        -> std::invoke_result_t<F, const Lapp &>;

    bool awaitStop(const std::string &name, const ServiceSender &sender) const;

    Config config_;
    std::shared_ptr<const LappLoader> loader_;
    std::shared_ptr<boost::asio::io_context> io_context_;
    SafeObject<std::map<std::string, std::shared_ptr<SharedLapp>>> lapps_;
    log::Logger log_;
  };

}  // namespace lapphost::lapps
