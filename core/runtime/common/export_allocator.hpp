/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "log/logger.hpp"
#include "runtime/memory.hpp"

namespace lapphost::runtime {
  class ModuleInstance;

  inline constexpr std::string_view kAllocExport = "alloc";
  inline constexpr std::string_view kDeallocExport = "dealloc";

  /**
   * Allocator backed by the `alloc` and `dealloc` exports of a lapp.
   * Does not own the instance, the instance owns it through its memory
   * provider.
   */
  class ExportAllocator final : public GuestAllocator {
   public:
    explicit ExportAllocator(ModuleInstance &instance);

    outcome::result<WasmPointer> allocate(WasmSize size) override;

    bool canDeallocate() const override;

    outcome::result<void> deallocate(WasmPointer ptr, WasmSize size) override;

   private:
    ModuleInstance &instance_;
    log::Logger logger_;
  };

}  // namespace lapphost::runtime
