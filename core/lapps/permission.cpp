/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "lapps/permission.hpp"

namespace lapphost::lapps {

  std::string_view toString(Permission permission) {
    switch (permission) {
      case Permission::FileRead:
        return "file_read";
      case Permission::FileWrite:
        return "file_write";
      case Permission::ClientHttp:
        return "client_http";
      case Permission::Websocket:
        return "websocket";
      case Permission::Http:
        return "http";
      case Permission::Tcp:
        return "tcp";
      case Permission::Database:
        return "database";
      case Permission::Sleep:
        return "sleep";
      case Permission::LappsIncoming:
        return "lapps_incoming";
      case Permission::LappsOutgoing:
        return "lapps_outgoing";
    }
    return "unknown";
  }

  std::optional<Permission> permissionFromString(std::string_view str) {
    for (auto permission : kAllPermissions) {
      if (toString(permission) == str) {
        return permission;
      }
    }
    return std::nullopt;
  }

}  // namespace lapphost::lapps
