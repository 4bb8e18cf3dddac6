/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>

#include "common/buffer.hpp"
#include "runtime/memory.hpp"
#include "runtime/memory_check.hpp"
#include "runtime/memory_provider.hpp"

namespace lapphost::runtime {
  /**
   * Lapp memory backed by a host vector with a bump allocator, records
   * live allocations to check that the host hands buffers back
   */
  struct TestMemory {
    explicit TestMemory(bool can_deallocate = true)
        : m(kMemoryPageSize, 0),
          handle{std::make_shared<TestMemoryHandle>(m)},
          provider{std::make_shared<MemoryProvider>()} {
      provider->setMemory(std::make_unique<Memory>(
          handle, std::make_unique<TestAllocator>(*this, can_deallocate)));
    }

    TestMemory(TestMemory &&) = delete;

    Buffer m;
    std::shared_ptr<MemoryHandle> handle;
    std::shared_ptr<MemoryProvider> provider;

    /// ptr -> size of regions allocated and not yet deallocated
    std::map<WasmPointer, WasmSize> allocated;
    WasmPointer next = 8;
    bool fail_allocation = false;

    struct TestMemoryHandle : MemoryHandle {
      Buffer &m;

      explicit TestMemoryHandle(Buffer &m) : m{m} {}

      uint64_t size() const override {
        return m.size();
      }

      outcome::result<BytesOut> view(WasmPointer ptr,
                                     WasmSize size) const override {
        if (not memoryCheck(ptr, size, m.size())) {
          return MemoryError::OUT_OF_BOUNDS;
        }
        return BytesOut{m.data() + ptr, size};
      }
    };

    struct TestAllocator : GuestAllocator {
      TestMemory &memory;
      bool can_deallocate;

      TestAllocator(TestMemory &memory, bool can_deallocate)
          : memory{memory}, can_deallocate{can_deallocate} {}

      outcome::result<WasmPointer> allocate(WasmSize size) override {
        if (memory.fail_allocation) {
          return MemoryError::ALLOCATOR_FAILED;
        }
        auto ptr = memory.next;
        if (ptr + size > memory.m.size()) {
          memory.m.resize(ptr + size);
        }
        memory.next += size;
        memory.allocated.emplace(ptr, size);
        return ptr;
      }

      bool canDeallocate() const override {
        return can_deallocate;
      }

      outcome::result<void> deallocate(WasmPointer ptr,
                                       WasmSize size) override {
        auto it = memory.allocated.find(ptr);
        if (it == memory.allocated.end() or it->second != size) {
          return MemoryError::ALLOCATOR_FAILED;
        }
        memory.allocated.erase(it);
        return outcome::success();
      }
    };

    Memory &memory() const {
      return provider->memory().value().get();
    }

    /// Stores `bytes` the way a lapp passes a buffer to the host
    WasmSpan store(BufferView bytes) {
      return memory().storeBuffer(bytes).value();
    }

    template <typename T>
    WasmSpan storeEncoded(const T &value) {
      return memory().storeEncoded(value).value();
    }

    /// Decodes a buffer returned by the host, handing it back
    template <typename T>
    T takeDecoded(WasmSpan span) {
      return memory().takeDecoded<T>(span).value();
    }
  };
}  // namespace lapphost::runtime
