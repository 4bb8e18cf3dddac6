/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include <fmt/format.h>

namespace lapphost::lapps {

  /**
   * Capability a lapp may declare and the host may grant
   */
  enum class Permission : uint8_t {
    FileRead,
    FileWrite,
    /// dispatch of browser/API requests into the lapp
    ClientHttp,
    /// delivery of messages to the lapp service
    Websocket,
    /// outbound HTTP requests made by the lapp
    Http,
    Tcp,
    Database,
    Sleep,
    LappsIncoming,
    LappsOutgoing,
  };

  inline constexpr std::array kAllPermissions{
      Permission::FileRead,
      Permission::FileWrite,
      Permission::ClientHttp,
      Permission::Websocket,
      Permission::Http,
      Permission::Tcp,
      Permission::Database,
      Permission::Sleep,
      Permission::LappsIncoming,
      Permission::LappsOutgoing,
  };

  std::string_view toString(Permission permission);

  std::optional<Permission> permissionFromString(std::string_view str);

}  // namespace lapphost::lapps

template <>
struct fmt::formatter<lapphost::lapps::Permission>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(lapphost::lapps::Permission permission,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        lapphost::lapps::toString(permission), ctx);
  }
};
