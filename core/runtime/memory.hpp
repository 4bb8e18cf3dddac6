/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstring>
#include <memory>
#include <span>

#include <boost/assert.hpp>
#include <scale/scale.hpp>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"
#include "runtime/common/memory_error.hpp"
#include "runtime/ptr_size.hpp"
#include "runtime/types.hpp"

namespace lapphost::runtime {
  using BytesOut = std::span<uint8_t>;

  // https://webassembly.github.io/spec/core/exec/runtime.html#memory-instances
  inline constexpr uint64_t kMemoryPageSize = 64 * 1024;

  /**
   * An interface for a particular WASM engine memory implementation
   */
  class MemoryHandle {
   public:
    virtual ~MemoryHandle() = default;

    /// Current size in bytes
    virtual uint64_t size() const = 0;

    /**
     * Bounds-checked view on lapp memory, fails with
     * MemoryError::OUT_OF_BOUNDS if the region exceeds current size
     */
    virtual outcome::result<BytesOut> view(WasmPointer ptr,
                                           WasmSize size) const = 0;
  };

  /**
   * Allocator exported by a lapp: `alloc(len) -> ptr` and optionally
   * `dealloc(ptr, len)`
   */
  class GuestAllocator {
   public:
    virtual ~GuestAllocator() = default;

    virtual outcome::result<WasmPointer> allocate(WasmSize size) = 0;

    /// Whether the lapp exports `dealloc`
    virtual bool canDeallocate() const = 0;

    virtual outcome::result<void> deallocate(WasmPointer ptr,
                                             WasmSize size) = 0;
  };

  /**
   * Memory bridge: a lapp memory handle paired with the lapp allocator.
   *
   * Buffers passed into the lapp are allocated with the lapp allocator and
   * belong to the lapp afterwards. Buffers returned by the lapp are copied
   * into host storage and handed back to `dealloc` if the lapp exports it.
   *
   * Mind that the underlying memory can be accessed through unaligned
   * pointers, so data is only ever copied with memcpy.
   */
  class Memory final {
   public:
    Memory(std::shared_ptr<MemoryHandle> handle,
           std::unique_ptr<GuestAllocator> allocator)
        : handle_{std::move(handle)}, allocator_{std::move(allocator)} {
      BOOST_ASSERT(handle_);
      BOOST_ASSERT(allocator_);
    }

    uint64_t size() const {
      return handle_->size();
    }

    outcome::result<BytesOut> view(WasmPointer ptr, WasmSize size) const {
      return handle_->view(ptr, size);
    }

    outcome::result<BytesOut> view(PtrSize ptr_size) const {
      return handle_->view(ptr_size.ptr, ptr_size.size);
    }

    /// Copies `size` bytes at `ptr` out of lapp memory
    outcome::result<Buffer> loadN(WasmPointer ptr, WasmSize size) const {
      OUTCOME_TRY(bytes, handle_->view(ptr, size));
      return Buffer{bytes.begin(), bytes.end()};
    }

    outcome::result<Buffer> load(WasmSpan span) const {
      PtrSize ptr_size{span};
      return loadN(ptr_size.ptr, ptr_size.size);
    }

    /**
     * Copies the buffer referenced by `span` out of lapp memory and returns
     * the region to the lapp allocator when it can deallocate
     */
    outcome::result<Buffer> take(WasmSpan span) {
      PtrSize ptr_size{span};
      OUTCOME_TRY(buffer, loadN(ptr_size.ptr, ptr_size.size));
      if (allocator_->canDeallocate()) {
        OUTCOME_TRY(allocator_->deallocate(ptr_size.ptr, ptr_size.size));
      }
      return buffer;
    }

    outcome::result<void> storeBuffer(WasmPointer ptr, BufferView v) {
      OUTCOME_TRY(bytes, handle_->view(ptr, v.size()));
      if (not v.empty()) {
        std::memcpy(bytes.data(), v.data(), v.size());
      }
      return outcome::success();
    }

    /**
     * Allocates a region in lapp memory and copies `v` there
     * @return pointer-size of the stored buffer
     */
    outcome::result<WasmSpan> storeBuffer(BufferView v) {
      auto size = static_cast<WasmSize>(v.size());
      if (size != v.size()) {
        return MemoryError::OUT_OF_BOUNDS;
      }
      OUTCOME_TRY(ptr, allocator_->allocate(size));
      if (not storeBuffer(ptr, v)) {
        return MemoryError::ALLOCATOR_FAILED;
      }
      return PtrSize{ptr, size}.combine();
    }

    template <typename T>
    outcome::result<WasmSpan> storeEncoded(const T &value) {
      OUTCOME_TRY(encoded, ::scale::encode(value));
      return storeBuffer(BufferView{encoded});
    }

    template <typename T>
    outcome::result<T> loadDecoded(WasmSpan span) const {
      OUTCOME_TRY(buffer, load(span));
      return decode<T>(buffer);
    }

    template <typename T>
    outcome::result<T> takeDecoded(WasmSpan span) {
      OUTCOME_TRY(buffer, take(span));
      return decode<T>(buffer);
    }

    template <typename T>
    static outcome::result<T> decode(BufferView bytes) {
      auto res = ::scale::decode<T>(bytes);
      if (not res) {
        return MemoryError::DECODE_FAILED;
      }
      return std::move(res.value());
    }

    GuestAllocator &allocator() const {
      return *allocator_;
    }

   private:
    std::shared_ptr<MemoryHandle> handle_;
    std::unique_ptr<GuestAllocator> allocator_;
  };
}  // namespace lapphost::runtime
