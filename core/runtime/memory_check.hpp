/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "runtime/types.hpp"

namespace lapphost::runtime {
  /// Whether [begin, begin + size) lies within a memory of `max` bytes
  inline bool memoryCheck(WasmPointer begin, WasmSize size, uint64_t max) {
    auto end = static_cast<uint64_t>(begin) + size;
    return end <= max;
  }
}  // namespace lapphost::runtime
