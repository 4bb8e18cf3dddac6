/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/uri.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace lapphost::common {

  std::string Uri::toString() const {
    std::string result;
    if (not Schema.empty()) {
      result += Schema;
      result += "://";
    }
    result += Host;
    if (not Port.empty()) {
      result += ":";
      result += Port;
    }
    result += Path;
    if (not Query.empty()) {
      result += "?";
      result += Query;
    }
    if (not Fragment.empty()) {
      result += "#";
      result += Fragment;
    }
    return result;
  }

  std::string Uri::target() const {
    std::string result = Path.empty() ? "/" : Path;
    if (not Query.empty()) {
      result += "?";
      result += Query;
    }
    return result;
  }

  std::optional<uint16_t> Uri::port() const {
    if (Port.empty()) {
      if (Schema == "https") {
        return 443;
      }
      if (Schema == "http" or Schema.empty()) {
        return 80;
      }
      return std::nullopt;
    }
    uint16_t port = 0;
    auto [ptr, ec] =
        std::from_chars(Port.data(), Port.data() + Port.size(), port);
    if (ec != std::errc{} or ptr != Port.data() + Port.size() or port == 0) {
      return std::nullopt;
    }
    return port;
  }

  Uri Uri::parse(std::string_view uri) {
    Uri result;

    auto fail = [&](std::string_view error) {
      if (not result.error_.has_value()) {
        result.error_.emplace(error);
      }
    };

    if (uri.empty()) {
      fail("Empty uri");
      return result;
    }

    // Schema
    size_t pos = 0;
    if (auto schema_end = uri.find("://"); schema_end != std::string_view::npos) {
      result.Schema = uri.substr(0, schema_end);
      pos = schema_end + 3;
      std::transform(result.Schema.begin(),
                     result.Schema.end(),
                     result.Schema.begin(),
                     [](unsigned char ch) { return std::tolower(ch); });
      if (result.Schema.empty()
          or not std::all_of(result.Schema.begin(),
                             result.Schema.end(),
                             [](unsigned char ch) { return std::isalpha(ch); })) {
        fail("Invalid schema");
      }
    }

    // Host
    auto host_end = uri.find_first_of(":/?#", pos);
    if (host_end == std::string_view::npos) {
      host_end = uri.size();
    }
    result.Host = uri.substr(pos, host_end - pos);
    if (result.Host.empty()
        or not std::all_of(result.Host.begin(),
                           result.Host.end(),
                           [](unsigned char ch) {
                             return std::isalnum(ch) or ch == '.' or ch == '-';
                           })) {
      fail("Invalid hostname");
    }
    pos = host_end;

    // Port
    if (pos < uri.size() and uri[pos] == ':') {
      auto port_end = uri.find_first_of("/?#", pos + 1);
      if (port_end == std::string_view::npos) {
        port_end = uri.size();
      }
      result.Port = uri.substr(pos + 1, port_end - pos - 1);
      if (result.Port.empty() or result.Port.size() > 5
          or not std::all_of(result.Port.begin(),
                             result.Port.end(),
                             [](unsigned char ch) { return std::isdigit(ch); })
          or not result.port().has_value()) {
        fail("Invalid port");
      }
      pos = port_end;
    }

    // Path
    auto path_end = uri.find_first_of("?#", pos);
    if (path_end == std::string_view::npos) {
      path_end = uri.size();
    }
    result.Path = uri.substr(pos, path_end - pos);
    pos = path_end;

    // Query
    if (pos < uri.size() and uri[pos] == '?') {
      auto query_end = uri.find('#', pos);
      if (query_end == std::string_view::npos) {
        query_end = uri.size();
      }
      result.Query = uri.substr(pos + 1, query_end - pos - 1);
      pos = query_end;
    }

    // Fragment
    if (pos < uri.size() and uri[pos] == '#') {
      result.Fragment = uri.substr(pos + 1);
    }

    return result;
  }
}  // namespace lapphost::common
