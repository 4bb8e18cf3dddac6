/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <wasmedge/wasmedge.h>

#include "log/logger.hpp"
#include "runtime/memory.hpp"

namespace lapphost::runtime::wasm_edge {

  /**
   * Linear memory exported by a WasmEdge module instance.
   * Does not own the memory instance.
   */
  class MemoryImpl final : public MemoryHandle {
   public:
    explicit MemoryImpl(WasmEdge_MemoryInstanceContext *mem_instance);

    uint64_t size() const override {
      return WasmEdge_MemoryInstanceGetPageSize(mem_instance_)
           * kMemoryPageSize;
    }

    outcome::result<BytesOut> view(WasmPointer ptr,
                                   WasmSize size) const override;

   private:
    WasmEdge_MemoryInstanceContext *mem_instance_;
    log::Logger logger_ = log::createLogger("Memory", "memory");
  };

}  // namespace lapphost::runtime::wasm_edge
