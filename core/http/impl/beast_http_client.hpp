/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "http/http_client.hpp"
#include "log/logger.hpp"

namespace lapphost::http {

  /**
   * HTTP/1.1 client over plain TCP or TLS.
   * Every request runs its own io_context on the calling thread, so a
   * lapp blocked in `invoke_http` never occupies the shared pool.
   */
  class BeastHttpClient final : public HttpClient {
   public:
    BeastHttpClient();

    outcome::result<Response> send(
        const Request &request,
        std::chrono::milliseconds timeout) const override;

   private:
    log::Logger log_;
  };

}  // namespace lapphost::http
