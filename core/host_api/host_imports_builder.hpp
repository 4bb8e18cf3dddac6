/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>

#include "filesystem/common.hpp"
#include "lapps/permission.hpp"
#include "lapps/settings.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "runtime/host_function.hpp"

namespace lapphost::http {
  class HttpClient;
}

namespace lapphost::runtime {
  class MemoryProvider;
}

namespace lapphost::host_api {

  inline constexpr std::string_view kDataDirName = "data";

  /**
   * Everything host functions of one lapp instance may close over
   */
  struct ImportsContext {
    filesystem::path root_dir;
    lapps::LappSettings settings;
    std::shared_ptr<const http::HttpClient> http_client;
    std::chrono::milliseconds http_timeout;
    std::shared_ptr<runtime::MemoryProvider> memory_provider;
  };

  /**
   * Builds imports of a lapp from its capabilities: filesystem imports iff
   * a file permission is required, host functions for every granted
   * permission that has a registrar. Nothing else is provided, so a lapp
   * importing a function it was not granted fails to instantiate.
   */
  class HostImportsBuilder {
   public:
    using Registrar = std::function<outcome::result<void>(
        const ImportsContext &, runtime::HostImports &)>;

    /// With database, http and sleep registrars
    HostImportsBuilder();

    explicit HostImportsBuilder(std::map<lapps::Permission, Registrar> registrars);

    outcome::result<runtime::HostImports> build(const ImportsContext &ctx) const;

    static std::map<lapps::Permission, Registrar> defaultRegistrars();

   private:
    outcome::result<std::optional<runtime::WasiConfig>> makeWasi(
        const ImportsContext &ctx) const;

    std::map<lapps::Permission, Registrar> registrars_;
    log::Logger logger_;
  };

}  // namespace lapphost::host_api
