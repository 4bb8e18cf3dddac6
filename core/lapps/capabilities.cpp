/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "lapps/capabilities.hpp"

namespace lapphost::lapps {

  Capabilities::Capabilities(std::set<Permission> required,
                             const std::set<Permission> &allowed)
      : required_{std::move(required)} {
    for (auto permission : allowed) {
      allow(permission);
    }
  }

  bool Capabilities::allow(Permission permission) {
    if (not isRequired(permission)) {
      return false;
    }
    return allowed_.insert(permission).second;
  }

  bool Capabilities::deny(Permission permission) {
    return allowed_.erase(permission) != 0;
  }

}  // namespace lapphost::lapps
