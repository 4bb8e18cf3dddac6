/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

#include "outcome/outcome.hpp"
#include "runtime/types.hpp"

namespace lapphost::runtime {

  enum class ValueType : uint8_t {
    I32,
    I64,
  };

  /// Raw wasm value, i32 values occupy the low 32 bits
  using WasmValue = uint64_t;

  template <typename T>
  constexpr ValueType valueType() = delete;

  template <>
  constexpr ValueType valueType<int32_t>() {
    return ValueType::I32;
  }

  template <>
  constexpr ValueType valueType<uint32_t>() {
    return ValueType::I32;
  }

  template <>
  constexpr ValueType valueType<int64_t>() {
    return ValueType::I64;
  }

  template <>
  constexpr ValueType valueType<uint64_t>() {
    return ValueType::I64;
  }

  /**
   * Function provided by the host to a lapp, imported from the `env` module.
   * Failure of the body traps the calling lapp.
   */
  struct HostFunction {
    using Body = std::function<outcome::result<std::optional<WasmValue>>(
        std::span<const WasmValue>)>;

    std::string name;
    std::vector<ValueType> params;
    std::optional<ValueType> result;
    Body body;

    /**
     * Makes a host function from a typed callable, deducing the wasm
     * signature from Ret and Args
     */
    template <typename Ret, typename... Args>
    static HostFunction make(
        std::string name,
        std::type_identity_t<std::function<outcome::result<Ret>(Args...)>> f) {
      HostFunction function{
          .name = std::move(name),
          .params = {valueType<Args>()...},
          .result = std::nullopt,
          .body = {},
      };
      if constexpr (not std::is_void_v<Ret>) {
        function.result = valueType<Ret>();
      }
      function.body = [f{std::move(f)}](std::span<const WasmValue> args)
          -> outcome::result<std::optional<WasmValue>> {
        if (args.size() != sizeof...(Args)) {
          return std::errc::invalid_argument;
        }
        return invoke<Ret, Args...>(
            f, args, std::make_index_sequence<sizeof...(Args)>());
      };
      return function;
    }

   private:
    template <typename Ret, typename... Args, size_t... Idxs>
    static outcome::result<std::optional<WasmValue>> invoke(
        const std::function<outcome::result<Ret>(Args...)> &f,
        [[maybe_unused]] std::span<const WasmValue> args,
        std::index_sequence<Idxs...>) {
      if constexpr (std::is_void_v<Ret>) {
        OUTCOME_TRY(f(static_cast<Args>(args[Idxs])...));
        return std::nullopt;
      } else {
        OUTCOME_TRY(res, f(static_cast<Args>(args[Idxs])...));
        return static_cast<WasmValue>(res);
      }
    }
  };

  /**
   * Filesystem imports (`wasi_snapshot_preview1`) of a lapp
   */
  struct WasiConfig {
    struct Preopen {
      std::string host_dir;
      bool readonly = true;
    };

    /// nullopt means no directory is visible to the lapp
    std::optional<Preopen> preopen;
  };

  /**
   * Everything the host provides to a lapp at instantiation
   */
  struct HostImports {
    std::vector<HostFunction> functions;
    std::optional<WasiConfig> wasi;

    bool hasFunction(std::string_view name) const {
      return std::any_of(functions.begin(),
                         functions.end(),
                         [&](const HostFunction &f) { return f.name == name; });
    }
  };

  inline constexpr std::string_view kHostModuleName = "env";

}  // namespace lapphost::runtime
