/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>

#include "runtime/memory.hpp"

namespace lapphost::runtime {

  /**
   * Handle to the memory bridge of one module instance.
   *
   * Host functions are created before the module is instantiated, so they
   * capture the provider and resolve the bridge on every call. The bridge is
   * set once the instance exposes `memory` and `alloc`, and reset when the
   * instance is dropped; afterwards every access fails with
   * MemoryError::MEMORY_NOT_READY.
   */
  class MemoryProvider {
   public:
    std::optional<std::reference_wrapper<Memory>> getCurrentMemory() const {
      if (current_memory_) {
        return std::ref(*current_memory_);
      }
      return std::nullopt;
    }

    outcome::result<std::reference_wrapper<Memory>> memory() const {
      if (auto memory = getCurrentMemory()) {
        return *memory;
      }
      return MemoryError::MEMORY_NOT_READY;
    }

    void setMemory(std::unique_ptr<Memory> memory) {
      current_memory_ = std::move(memory);
    }

    void resetMemory() {
      current_memory_.reset();
    }

   private:
    std::unique_ptr<Memory> current_memory_;
  };

}  // namespace lapphost::runtime
