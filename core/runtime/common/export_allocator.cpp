/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/common/export_allocator.hpp"

#include <array>

#include "runtime/module_instance.hpp"

namespace lapphost::runtime {

  ExportAllocator::ExportAllocator(ModuleInstance &instance)
      : instance_{instance},
        logger_{log::createLogger("ExportAllocator", "memory")} {}

  outcome::result<WasmPointer> ExportAllocator::allocate(WasmSize size) {
    const std::array<WasmValue, 1> args{size};
    auto res = instance_.invoke(kAllocExport, args);
    if (not res) {
      SL_WARN(logger_,
              "Lapp allocator failed to allocate {} bytes: {}",
              size,
              res.error().message());
      return MemoryError::ALLOCATOR_FAILED;
    }
    if (not res.value()) {
      SL_WARN(logger_, "Lapp allocator returned no pointer");
      return MemoryError::ALLOCATOR_FAILED;
    }
    auto ptr = static_cast<WasmPointer>(*res.value());
    SL_TRACE(logger_, "Allocated {} bytes at {}", size, ptr);
    return ptr;
  }

  bool ExportAllocator::canDeallocate() const {
    return instance_.hasExport(kDeallocExport);
  }

  outcome::result<void> ExportAllocator::deallocate(WasmPointer ptr,
                                                    WasmSize size) {
    const std::array<WasmValue, 2> args{ptr, size};
    if (auto res = instance_.invoke(kDeallocExport, args); not res) {
      SL_WARN(logger_,
              "Lapp allocator failed to free {} bytes at {}: {}",
              size,
              ptr,
              res.error().message());
      return MemoryError::ALLOCATOR_FAILED;
    }
    return outcome::success();
  }

}  // namespace lapphost::runtime
