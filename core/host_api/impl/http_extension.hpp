/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>

#include "common/scale_result.hpp"
#include "http/types.hpp"
#include "lapps/settings.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "runtime/types.hpp"

namespace lapphost::http {
  class HttpClient;
}

namespace lapphost::runtime {
  class MemoryProvider;
}

namespace lapphost::host_api {

  using HttpResult = Result<http::Response, std::string>;

  /**
   * Outbound HTTP requests of a lapp, restricted by its network settings
   */
  class HttpExtension final {
   public:
    HttpExtension(
        std::shared_ptr<const http::HttpClient> client,
        lapps::HttpSettings settings,
        std::chrono::milliseconds default_timeout,
        std::shared_ptr<const runtime::MemoryProvider> memory_provider);

    /// in: HttpRequest, out: Result<HttpResponse, String>
    outcome::result<runtime::WasmSpan> invoke_http(runtime::WasmSpan request);

    HttpResult invoke(const http::Request &request) const;

   private:
    std::shared_ptr<const http::HttpClient> client_;
    lapps::HttpSettings settings_;
    std::chrono::milliseconds default_timeout_;
    std::shared_ptr<const runtime::MemoryProvider> memory_provider_;
    log::Logger logger_;
  };

}  // namespace lapphost::host_api
