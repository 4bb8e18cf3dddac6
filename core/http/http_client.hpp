/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

#include "http/types.hpp"
#include "outcome/outcome.hpp"

namespace lapphost::http {

  enum class HttpClientError {
    INVALID_URI = 1,
    UNSUPPORTED_SCHEMA,
    INVALID_METHOD,
    INVALID_HEADER,
    TIMEOUT,
  };

  /**
   * Outbound HTTP client shared by all lapps
   */
  class HttpClient {
   public:
    virtual ~HttpClient() = default;

    /**
     * Sends `request` and waits for the whole response
     * @param timeout - deadline for the complete exchange
     */
    virtual outcome::result<Response> send(
        const Request &request, std::chrono::milliseconds timeout) const = 0;
  };

}  // namespace lapphost::http

OUTCOME_HPP_DECLARE_ERROR(lapphost::http, HttpClientError);
