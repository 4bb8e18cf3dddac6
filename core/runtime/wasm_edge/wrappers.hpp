/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <concepts>
#include <string_view>
#include <utility>

#include <wasmedge/wasmedge.h>

namespace lapphost::runtime::wasm_edge {

  /**
   * Owning handle of a WasmEdge context pointer
   */
  template <typename T, auto deleter>
    requires std::is_pointer_v<T> and std::invocable<decltype(deleter), T>
  class Wrapper {
   public:
    Wrapper() = default;

    Wrapper(T t) : t{t} {}

    Wrapper(const Wrapper &) = delete;
    Wrapper &operator=(const Wrapper &) = delete;

    Wrapper(Wrapper &&other) noexcept : t{std::exchange(other.t, nullptr)} {}

    Wrapper &operator=(Wrapper &&other) noexcept {
      if (this != &other) {
        reset();
        t = std::exchange(other.t, nullptr);
      }
      return *this;
    }

    ~Wrapper() {
      reset();
    }

    void reset() {
      if (t) {
        deleter(t);
        t = nullptr;
      }
    }

    T &raw() {
      return t;
    }

    T raw() const {
      return t;
    }

    bool operator==(std::nullptr_t) const {
      return t == nullptr;
    }

   private:
    T t = nullptr;
  };

  using ConfigureContext =
      Wrapper<WasmEdge_ConfigureContext *, WasmEdge_ConfigureDelete>;
  using LoaderContext =
      Wrapper<WasmEdge_LoaderContext *, WasmEdge_LoaderDelete>;
  using ValidatorContext =
      Wrapper<WasmEdge_ValidatorContext *, WasmEdge_ValidatorDelete>;
  using FunctionTypeContext =
      Wrapper<WasmEdge_FunctionTypeContext *, WasmEdge_FunctionTypeDelete>;
  using ExecutorContext =
      Wrapper<WasmEdge_ExecutorContext *, WasmEdge_ExecutorDelete>;
  using StoreContext = Wrapper<WasmEdge_StoreContext *, WasmEdge_StoreDelete>;
  using ModuleInstanceContext = Wrapper<WasmEdge_ModuleInstanceContext *,
                                        WasmEdge_ModuleInstanceDelete>;
  using ASTModuleContext =
      Wrapper<WasmEdge_ASTModuleContext *, WasmEdge_ASTModuleDelete>;

  /**
   * Owning WasmEdge string
   */
  class String {
   public:
    explicit String(std::string_view str)
        : str_{WasmEdge_StringCreateByBuffer(str.data(), str.size())} {}

    String(const String &) = delete;
    String &operator=(const String &) = delete;

    ~String() {
      WasmEdge_StringDelete(str_);
    }

    const WasmEdge_String &raw() const {
      return str_;
    }

   private:
    WasmEdge_String str_;
  };

}  // namespace lapphost::runtime::wasm_edge
