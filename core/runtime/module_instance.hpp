/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>

#include <scale/scale.hpp>

#include "common/buffer.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "runtime/host_function.hpp"
#include "runtime/ptr_size.hpp"

namespace lapphost::runtime {
  class MemoryProvider;

  /**
   * An instance of a lapp module bound to one linear memory.
   * Exposes a set of functions.
   *
   * Calls into an instance are serialized: `invoke` and the buffer calls
   * below hold `mutex()`, which is recursive since host functions re-enter
   * the lapp allocator while a call is in progress.
   */
  class ModuleInstance {
   public:
    enum class Error {
      EXPORT_NOT_FOUND = 1,
      INVALID_SIGNATURE,
      INVALID_CALL_RESULT,
    };

    virtual ~ModuleInstance() = default;

    virtual bool hasExport(std::string_view name) const = 0;

    /**
     * Call an export function with raw wasm arguments
     * @return the single result of the function, if any
     */
    virtual outcome::result<std::optional<WasmValue>> invoke(
        std::string_view name, std::span<const WasmValue> args) = 0;

    virtual std::shared_ptr<MemoryProvider> memoryProvider() const = 0;

    /**
     * Call an export function of signature `(i64) -> i64`
     * @param name - name of the function
     * @param args - buffer with the function parameters, stored into the
     * lapp memory with the lapp allocator
     * @return the buffer returned by the call, copied out of the lapp memory
     */
    outcome::result<Buffer> callExportFunction(std::string_view name,
                                               BufferView args);

    template <typename Res, typename Arg>
    outcome::result<Res> callAndDecodeExportFunction(std::string_view name,
                                                     const Arg &arg) {
      OUTCOME_TRY(args, ::scale::encode(arg));
      OUTCOME_TRY(result, callExportFunction(name, args));
      auto res = ::scale::decode<Res>(result);
      if (not res) {
        SL_DEBUG(log(),
                 "Result of '{}' could not be decoded: {}",
                 name,
                 res.error().message());
        return Error::INVALID_CALL_RESULT;
      }
      return std::move(res.value());
    }

    std::recursive_mutex &mutex() const {
      return mutex_;
    }

   private:
    static log::Logger &log();

    mutable std::recursive_mutex mutex_;
  };

}  // namespace lapphost::runtime

OUTCOME_HPP_DECLARE_ERROR(lapphost::runtime, ModuleInstance::Error);
