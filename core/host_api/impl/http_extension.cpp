/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host_api/impl/http_extension.hpp"

#include <algorithm>
#include <cctype>

#include "common/uri.hpp"
#include "http/http_client.hpp"
#include "runtime/memory_provider.hpp"

namespace lapphost::host_api {

  HttpExtension::HttpExtension(
      std::shared_ptr<const http::HttpClient> client,
      lapps::HttpSettings settings,
      std::chrono::milliseconds default_timeout,
      std::shared_ptr<const runtime::MemoryProvider> memory_provider)
      : client_{std::move(client)},
        settings_{std::move(settings)},
        default_timeout_{default_timeout},
        memory_provider_{std::move(memory_provider)},
        logger_{log::createLogger("HttpExtension", "http_extension")} {
    BOOST_ASSERT(client_);
    BOOST_ASSERT(memory_provider_);
  }

  HttpResult HttpExtension::invoke(const http::Request &request) const {
    std::string method = request.method;
    std::transform(method.begin(),
                   method.end(),
                   method.begin(),
                   [](unsigned char ch) { return std::toupper(ch); });
    if (not settings_.isMethodAllowed(method)) {
      SL_DEBUG(logger_, "Method {} is not allowed", method);
      return HttpResult::err(fmt::format("Method {} is not allowed", method));
    }

    auto uri = common::Uri::parse(request.uri);
    if (uri.error().has_value()) {
      return HttpResult::err(
          fmt::format("Invalid uri '{}': {}", request.uri, *uri.error()));
    }
    if (not settings_.isHostAllowed(uri.Host)) {
      SL_DEBUG(logger_, "Host {} is not allowed", uri.Host);
      return HttpResult::err(fmt::format("Host {} is not allowed", uri.Host));
    }

    auto normalized = request;
    normalized.method = std::move(method);
    auto res = client_->send(normalized,
                             settings_.timeout.value_or(default_timeout_));
    if (not res) {
      SL_DEBUG(logger_,
               "{} {} failed: {}",
               normalized.method,
               request.uri,
               res.error().message());
      return HttpResult::err(res.error().message());
    }
    return HttpResult::ok(std::move(res.value()));
  }

  outcome::result<runtime::WasmSpan> HttpExtension::invoke_http(
      runtime::WasmSpan request) {
    OUTCOME_TRY(memory, memory_provider_->memory());
    OUTCOME_TRY(req, memory.get().takeDecoded<http::Request>(request));
    return memory.get().storeEncoded(invoke(req));
  }

}  // namespace lapphost::host_api
