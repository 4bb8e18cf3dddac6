/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "lapps/lapp.hpp"
#include "lapps/lapps_manager.hpp"
#include "outcome/outcome.hpp"

namespace lapphost::api {

  enum class LappsJsonError {
    PARSE_FAILED = 1,
    MISSING_LAPP_NAME,
    INVALID_FIELD,
  };

  /**
   * Admin request changing a lapp:
   * {"lapp_name": "calc", "enabled": true, "allow_permission": "http",
   *  "deny_permission": "sleep"}
   */
  struct UpdateRequest {
    std::string lapp_name;
    lapps::UpdateQuery query;

    bool operator==(const UpdateRequest &) const = default;
  };

  /// {"lapps": [{"name", "title", "enabled", "permissions": {"required",
  /// "allowed"}, "loaded", "service_running"}, ...]}
  std::string lappsToJson(const std::vector<lapps::LappInfo> &lapps);

  outcome::result<UpdateRequest> parseUpdateRequest(std::string_view json);

  /// {"updated": {"lapp_name", ...changed fields}}
  std::string updatedToJson(const UpdateRequest &updated);

}  // namespace lapphost::api

OUTCOME_HPP_DECLARE_ERROR(lapphost::api, LappsJsonError);
