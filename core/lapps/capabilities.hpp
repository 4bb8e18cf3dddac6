/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <set>

#include "lapps/permission.hpp"

namespace lapphost::lapps {

  /**
   * Permissions declared by a lapp (required) and granted to it by the host
   * (allowed). Allowed permissions are always a subset of required ones.
   */
  class Capabilities {
   public:
    Capabilities() = default;

    /// Permissions of `allowed` that are not required are dropped
    Capabilities(std::set<Permission> required,
                 const std::set<Permission> &allowed);

    const std::set<Permission> &requiredPermissions() const {
      return required_;
    }

    const std::set<Permission> &allowedPermissions() const {
      return allowed_;
    }

    bool isRequired(Permission permission) const {
      return required_.contains(permission);
    }

    bool isAllowed(Permission permission) const {
      return allowed_.contains(permission);
    }

    /**
     * Grants a required permission
     * @return whether the allowed set changed
     */
    bool allow(Permission permission);

    /**
     * Revokes a permission
     * @return whether the allowed set changed
     */
    bool deny(Permission permission);

    bool operator==(const Capabilities &) const = default;

   private:
    std::set<Permission> required_;
    std::set<Permission> allowed_;
  };

}  // namespace lapphost::lapps
