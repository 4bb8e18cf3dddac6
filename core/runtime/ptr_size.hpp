/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <tuple>

#include "runtime/types.hpp"

namespace lapphost::runtime {
  /**
   * Variable-length value crossing the host/lapp boundary: an i64 where the
   * high 32 bits are the address and the low 32 bits are the size of the
   * buffer in the lapp linear memory.
   */
  struct PtrSize {
    constexpr PtrSize() = default;

    explicit constexpr PtrSize(WasmSpan v) {
      std::tie(ptr, size) = splitSpan(v);
    }

    constexpr PtrSize(WasmPointer ptr, WasmSize size) : ptr{ptr}, size{size} {}

    /**
     * @brief makes combined pointer-size value
     * @return pointer-size uint64_t value
     */
    constexpr WasmSpan combine() const {
      return (static_cast<uint64_t>(ptr) << 32ull)
           | static_cast<uint64_t>(size);
    }

    bool operator==(const PtrSize &rhs) const = default;

    WasmPointer ptr = 0u;  ///< address of buffer
    WasmSize size = 0u;    ///< length of buffer
  };

}  // namespace lapphost::runtime
