/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <utility>

namespace lapphost::runtime {

  using WasmPointer = uint32_t;

  /**
   * @brief combination of pointer and size, where most significant part
   * represents wasm pointer, and less significant represents size
   */
  using WasmSpan = uint64_t;

  /**
   * @brief Size type is uint32_t because we are working in 32 bit address
   * space
   */
  using WasmSize = uint32_t;

  using WasmI32 = int32_t;
  using WasmI64 = int64_t;

  /**
   * Splits 64 bit wasm span on 32 bit pointer and 32 bit size
   */
  static constexpr std::pair<WasmPointer, WasmSize> splitSpan(WasmSpan span) {
    const auto unsigned_result = static_cast<uint64_t>(span);
    const uint32_t minor_part = unsigned_result & 0xFFFFFFFFLLU;
    const uint32_t major_part = (unsigned_result >> 32u) & 0xFFFFFFFFLLU;

    return {major_part, minor_part};
  }

}  // namespace lapphost::runtime
