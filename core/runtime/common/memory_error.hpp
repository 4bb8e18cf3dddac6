/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace lapphost::runtime {
  /**
   * Failures of the host/lapp boundary
   */
  enum class MemoryError {
    OUT_OF_BOUNDS = 1,
    ALLOCATOR_FAILED,
    MEMORY_NOT_READY,
    DECODE_FAILED,
  };
}  // namespace lapphost::runtime

OUTCOME_HPP_DECLARE_ERROR(lapphost::runtime, MemoryError);
