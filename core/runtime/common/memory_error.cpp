/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/common/memory_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lapphost::runtime, MemoryError, e) {
  using E = lapphost::runtime::MemoryError;
  switch (e) {
    case E::OUT_OF_BOUNDS:
      return "MemoryError: Memory access out of bounds";
    case E::ALLOCATOR_FAILED:
      return "MemoryError: Lapp allocator failed";
    case E::MEMORY_NOT_READY:
      return "MemoryError: Lapp memory is not available";
    case E::DECODE_FAILED:
      return "MemoryError: Boundary value can not be decoded";
  }
  return "MemoryError: Unknown error";
}
