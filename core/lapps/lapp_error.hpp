/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace lapphost::lapps {

  /**
   * Failures of operations on a single lapp
   */
  enum class LappError {
    NOT_FOUND = 1,
    NOT_LOADED,
    NOT_ENABLED,
    PERMISSION_DENIED,
    LOCK_UNAVAILABLE,
    ALREADY_LOADED,
  };

}  // namespace lapphost::lapps

OUTCOME_HPP_DECLARE_ERROR(lapphost::lapps, LappError);
