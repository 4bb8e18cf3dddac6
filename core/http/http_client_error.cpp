/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "http/http_client.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lapphost::http, HttpClientError, e) {
  using E = lapphost::http::HttpClientError;
  switch (e) {
    case E::INVALID_URI:
      return "Request uri is invalid";
    case E::UNSUPPORTED_SCHEMA:
      return "Only http and https uris are supported";
    case E::INVALID_METHOD:
      return "Request method is unknown";
    case E::INVALID_HEADER:
      return "Request header is invalid";
    case E::TIMEOUT:
      return "Deadline has reached";
  }
  return "Unknown http client error";
}
