/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/wasm_edge/memory_impl.hpp"

#include "runtime/common/memory_error.hpp"
#include "runtime/memory_check.hpp"

namespace lapphost::runtime::wasm_edge {

  MemoryImpl::MemoryImpl(WasmEdge_MemoryInstanceContext *mem_instance)
      : mem_instance_{mem_instance} {
    BOOST_ASSERT(mem_instance_ != nullptr);
    SL_DEBUG(logger_,
             "Created memory wrapper {} for instance {}",
             fmt::ptr(this),
             fmt::ptr(mem_instance_));
  }

  outcome::result<BytesOut> MemoryImpl::view(WasmPointer ptr,
                                             WasmSize size) const {
    if (not memoryCheck(ptr, size, this->size())) {
      SL_DEBUG(logger_,
               "Access to [{}, {}+{}) is out of memory of size {}",
               ptr,
               ptr,
               size,
               this->size());
      return MemoryError::OUT_OF_BOUNDS;
    }
    if (size == 0) {
      return BytesOut{};
    }
    auto raw = WasmEdge_MemoryInstanceGetPointer(mem_instance_, ptr, size);
    if (raw == nullptr) {
      return MemoryError::OUT_OF_BOUNDS;
    }
    return BytesOut{raw, size};
  }

}  // namespace lapphost::runtime::wasm_edge
