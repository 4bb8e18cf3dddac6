/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "http/http_client.hpp"

#include <gmock/gmock.h>

namespace lapphost::http {

  class HttpClientMock final : public HttpClient {
   public:
    MOCK_METHOD(outcome::result<Response>,
                send,
                (const Request &, std::chrono::milliseconds),
                (const, override));
  };

}  // namespace lapphost::http
