/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lapphost::common {

  /**
   * Absolute http(s) URI split into the parts needed to send a request
   */
  struct Uri final {
   public:
    std::string Schema;
    std::string Host;
    std::string Port;
    std::string Path;
    std::string Query;
    std::string Fragment;

    static Uri parse(std::string_view uri);

    std::string toString() const;

    /// Request target: path and query, "/" if both are empty
    std::string target() const;

    /// Explicit port or the default one of the schema
    std::optional<uint16_t> port() const;

    bool isSecure() const {
      return Schema == "https";
    }

    const std::optional<std::string_view> &error() const {
      return error_;
    }

   private:
    std::optional<std::string_view> error_;
  };

}  // namespace lapphost::common
