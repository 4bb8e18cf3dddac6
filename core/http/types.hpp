/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include <scale/scale.hpp>

#include "common/buffer.hpp"

namespace lapphost::http {

  struct Header {
    std::string name;
    std::string value;

    bool operator==(const Header &) const = default;

    friend ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const Header &h) {
      return s << h.name << h.value;
    }

    friend ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, Header &h) {
      return s >> h.name >> h.value;
    }
  };

  using Headers = std::vector<Header>;

  /**
   * HTTP request as seen by a lapp, either dispatched into `process_http`
   * or sent by the lapp through `invoke_http`
   */
  struct Request {
    std::string method;
    std::string uri;
    Headers headers;
    Buffer body;

    bool operator==(const Request &) const = default;

    friend ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const Request &r) {
      return s << r.method << r.uri << r.headers << r.body;
    }

    friend ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, Request &r) {
      return s >> r.method >> r.uri >> r.headers >> r.body;
    }
  };

  struct Response {
    uint16_t status = 200;
    Headers headers;
    Buffer body;

    bool operator==(const Response &) const = default;

    friend ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const Response &r) {
      return s << r.status << r.headers << r.body;
    }

    friend ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, Response &r) {
      return s >> r.status >> r.headers >> r.body;
    }
  };

}  // namespace lapphost::http
