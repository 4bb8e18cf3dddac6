/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "common/buffer.hpp"
#include "filesystem/common.hpp"
#include "http/types.hpp"
#include "lapps/lapp_error.hpp"
#include "lapps/lapp_loader.hpp"
#include "lapps/permission.hpp"
#include "lapps/service/service_sender.hpp"
#include "lapps/settings.hpp"
#include "log/logger.hpp"
#include "utils/safe_object.hpp"

namespace lapphost::runtime {
  class ModuleInstance;
}

namespace lapphost::lapps {

  /**
   * Changes of a lapp requested by an administrator
   */
  struct UpdateQuery {
    std::optional<bool> enabled;
    std::optional<Permission> allow_permission;
    std::optional<Permission> deny_permission;

    bool empty() const {
      return not enabled and not allow_permission and not deny_permission;
    }

    bool operator==(const UpdateQuery &) const = default;
  };

  /**
   * An application hosted by the node: its settings, the module instance
   * while loaded and the endpoint of its background service while running.
   *
   * Not thread safe, the manager wraps every lapp into SafeObject.
   */
  class Lapp {
   public:
    /// Administrative lapp, has no settings and is never loaded automatically
    static constexpr std::string_view kMainName = "main";

    Lapp(std::string name,
         filesystem::path root_dir,
         std::shared_ptr<const LappLoader> loader);

    /// For a lapp whose settings are already known
    Lapp(std::string name,
         filesystem::path root_dir,
         LappSettings settings,
         std::shared_ptr<const LappLoader> loader);

    const std::string &name() const {
      return name_;
    }

    const filesystem::path &rootDir() const {
      return root_dir_;
    }

    bool isMain() const {
      return name_ == kMainName;
    }

    const LappSettings &settings() const {
      return settings_;
    }

    filesystem::path settingsFile() const;

    filesystem::path serverModuleFile() const;

    outcome::result<void> reloadSettings();

    outcome::result<void> saveSettings() const;

    bool isLoaded() const {
      return instance_ != nullptr;
    }

    bool isEnabled() const {
      return settings_.application.enabled;
    }

    bool isAllowed(Permission permission) const {
      return settings_.permissions.isAllowed(permission);
    }

    /**
     * Instantiates the lapp module with the current settings.
     * A failed load leaves the lapp unloaded.
     */
    LoadOutcome<void> load();

    /**
     * Drops the module instance, which invalidates its memory bridge.
     * @return the service endpoint, if the service was running, for the
     * caller to stop it
     */
    std::optional<ServiceSender> unload();

    /**
     * Applies `query` and saves settings.
     * The loaded instance is kept as is, permission changes take effect on
     * the next load.
     * @return the fields of `query` that actually changed something
     */
    outcome::result<UpdateQuery> update(const UpdateQuery &query);

    /// Dispatches a request into `process_http` of the lapp
    outcome::result<http::Response> processHttp(
        const http::Request &request) const;

    /**
     * Routes a message of the lapp service into `route_message`
     * @return error reported by the lapp, if any
     */
    outcome::result<std::optional<std::string>> routeMessage(
        BufferView message) const;

    const std::optional<ServiceSender> &serviceSender() const {
      return service_sender_;
    }

    void setServiceSender(ServiceSender sender) {
      service_sender_ = std::move(sender);
    }

    std::optional<ServiceSender> takeServiceSender() {
      return std::exchange(service_sender_, std::nullopt);
    }

   private:
    std::string name_;
    filesystem::path root_dir_;
    LappSettings settings_;
    std::shared_ptr<const LappLoader> loader_;
    std::shared_ptr<runtime::ModuleInstance> instance_;
    std::optional<ServiceSender> service_sender_;
    log::Logger log_;
  };

  using SharedLapp = SafeObject<Lapp>;

}  // namespace lapphost::lapps
