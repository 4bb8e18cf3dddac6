/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <chrono>
#include <memory>
#include <stdexcept>

#include "filesystem/common.hpp"
#include "lapps/settings.hpp"
#include "log/logger.hpp"
#include "outcome/custom.hpp"
#include "outcome/outcome.hpp"

namespace lapphost::runtime {
  class ModuleFactory;
  class ModuleInstance;
}  // namespace lapphost::runtime

namespace lapphost::host_api {
  class HostImportsBuilder;
}

namespace lapphost::http {
  class HttpClient;
}

namespace lapphost::lapps {

  enum class LoaderError {
    READ_MODULE_FAILED = 1,
    COMPILATION_FAILED,
    DATABASE_OPEN_FAILED,
    INSTANTIATION_FAILED,
    MEMORY_EXPORT_MISSING,
    STARTUP_FAILED,
    INIT_RESULT_INVALID,
    APPLICATION_INIT_FAILED,
  };

}  // namespace lapphost::lapps

OUTCOME_HPP_DECLARE_ERROR(lapphost::lapps, LoaderError);

namespace lapphost::lapps {

  /**
   * Failure of a lapp load: the error code plus a message, which for
   * APPLICATION_INIT_FAILED is the one reported by the lapp itself
   */
  struct LoadError : std::runtime_error {
    LoadError(std::error_code code, const std::string &message)
        : std::runtime_error{message}, code{code} {}

    LoadError(LoaderError code, const std::string &message)
        : LoadError{make_error_code(code), message} {}

    LoadError(const std::error_code &ec) : LoadError{ec, ec.message()} {}

    std::string_view message() const {
      return what();
    }

    std::error_code code;
  };

  inline std::error_code make_error_code(const LoadError &e) {
    return e.code;
  }

  template <typename R>
  using LoadOutcome = CustomOutcome<R, LoadError>;

  inline void outcome_throw_as_system_error_with_payload(const LoadError &e) {
    throw e;
  }

  struct LoadRequest {
    std::string name;
    filesystem::path root_dir;
    LappSettings settings;
  };

  /**
   * Turns a lapp on disk into a running module instance
   */
  class LappLoader {
   public:
    static constexpr std::string_view kInitExport = "init";
    static constexpr std::array kStartExports{"_initialize", "_start"};

    LappLoader(std::shared_ptr<runtime::ModuleFactory> module_factory,
               std::shared_ptr<host_api::HostImportsBuilder> imports_builder,
               std::shared_ptr<const http::HttpClient> http_client,
               std::chrono::milliseconds http_timeout);

    virtual ~LappLoader() = default;

    static filesystem::path serverModuleFile(const filesystem::path &root_dir,
                                             std::string_view name);

    /**
     * Reads, instantiates and starts the module of a lapp.
     * Either returns a fully started instance or drops everything built.
     */
    virtual LoadOutcome<std::shared_ptr<runtime::ModuleInstance>> load(
        const LoadRequest &request) const;

   private:
    LoadOutcome<void> startup(runtime::ModuleInstance &instance) const;

    std::shared_ptr<runtime::ModuleFactory> module_factory_;
    std::shared_ptr<host_api::HostImportsBuilder> imports_builder_;
    std::shared_ptr<const http::HttpClient> http_client_;
    std::chrono::milliseconds http_timeout_;
    log::Logger log_;
  };

}  // namespace lapphost::lapps
