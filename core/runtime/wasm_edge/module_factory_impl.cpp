/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/wasm_edge/module_factory_impl.hpp"

#include <wasmedge/wasmedge.h>

#include "runtime/common/export_allocator.hpp"
#include "runtime/memory_provider.hpp"
#include "runtime/module.hpp"
#include "runtime/module_instance.hpp"
#include "runtime/wasm_edge/memory_impl.hpp"
#include "runtime/wasm_edge/register_host_functions.hpp"
#include "runtime/wasm_edge/wrappers.hpp"

namespace lapphost::runtime::wasm_edge {

  static constexpr std::string_view kMemoryName = "memory";

  static const class final : public std::error_category {
   public:
    const char *name() const noexcept override {
      return "WasmEdge";
    }

    std::string message(int code) const override {
      auto res = WasmEdge_ResultGen(WasmEdge_ErrCategory_WASM, code);
      return WasmEdge_ResultGetMessage(res);
    }
  } wasm_edge_err_category;

  std::error_code make_error_code(WasmEdge_Result res) {
    return std::error_code{static_cast<int>(WasmEdge_ResultGetCode(res)),
                           wasm_edge_err_category};
  }

  // NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define WasmEdge_UNWRAP(expr)                                             \
  if (auto _wasm_edge_res = (expr); !WasmEdge_ResultOK(_wasm_edge_res)) { \
    return make_error_code(_wasm_edge_res);                               \
  }

#define WasmEdge_UNWRAP_COMPILE_ERR(expr)                                      \
  if (auto _wasm_edge_res = (expr); !WasmEdge_ResultOK(_wasm_edge_res)) {      \
    return CompilationError(                                                   \
        fmt::format(#expr ": {}", WasmEdge_ResultGetMessage(_wasm_edge_res))); \
  }

  inline CompilationOutcome<ConfigureContext> configureCtx() {
    ConfigureContext ctx{WasmEdge_ConfigureCreate()};
    if (ctx == nullptr) {
      return CompilationError{"WasmEdge_ConfigureCreate returned nullptr"};
    }
    return ctx;
  }

  class ModuleImpl;

  class ModuleInstanceImpl : public ModuleInstance {
   public:
    ModuleInstanceImpl(std::shared_ptr<const ModuleImpl> module,
                       std::unique_ptr<const std::vector<HostFunction>> functions,
                       StoreContext store,
                       ExecutorContext executor,
                       ModuleInstanceContext host_instance,
                       ModuleInstanceContext wasi_instance,
                       std::shared_ptr<MemoryProvider> memory_provider)
        : module_{std::move(module)},
          functions_{std::move(functions)},
          store_{std::move(store)},
          executor_{std::move(executor)},
          host_instance_{std::move(host_instance)},
          wasi_instance_{std::move(wasi_instance)},
          memory_provider_{std::move(memory_provider)} {
      BOOST_ASSERT(module_ != nullptr);
      BOOST_ASSERT(functions_ != nullptr);
      BOOST_ASSERT(memory_provider_ != nullptr);
    }

    ~ModuleInstanceImpl() override {
      // host functions still holding the provider must not reach the memory
      // of a destroyed instance
      memory_provider_->resetMemory();
    }

    /// Runs the start section of the module
    outcome::result<void> instantiate(const WasmEdge_ASTModuleContext *ast) {
      WasmEdge_UNWRAP(WasmEdge_ExecutorRegisterImport(
          executor_.raw(), store_.raw(), host_instance_.raw()));
      if (not(wasi_instance_ == nullptr)) {
        WasmEdge_UNWRAP(WasmEdge_ExecutorRegisterImport(
            executor_.raw(), store_.raw(), wasi_instance_.raw()));
      }
      WasmEdge_UNWRAP(WasmEdge_ExecutorInstantiate(
          executor_.raw(), &instance_.raw(), store_.raw(), ast));
      return outcome::success();
    }

    /// Binds the memory bridge once the instance is alive
    void bindMemory() {
      String memory_name{kMemoryName};
      auto memory_ctx =
          WasmEdge_ModuleInstanceFindMemory(instance_.raw(), memory_name.raw());
      if (memory_ctx == nullptr) {
        SL_DEBUG(log_, "Module does not export '{}'", kMemoryName);
        return;
      }
      memory_provider_->setMemory(
          std::make_unique<Memory>(std::make_shared<MemoryImpl>(memory_ctx),
                                   std::make_unique<ExportAllocator>(*this)));
    }

    bool hasExport(std::string_view name) const override {
      return findFunction(name) != nullptr;
    }

    outcome::result<std::optional<WasmValue>> invoke(
        std::string_view name, std::span<const WasmValue> args) override {
      std::lock_guard lock{mutex()};
      auto func = findFunction(name);
      if (func == nullptr) {
        return Error::EXPORT_NOT_FOUND;
      }
      auto type = WasmEdge_FunctionInstanceGetFunctionType(func);
      std::vector<WasmEdge_ValType> param_types(
          WasmEdge_FunctionTypeGetParametersLength(type));
      std::vector<WasmEdge_ValType> ret_types(
          WasmEdge_FunctionTypeGetReturnsLength(type));
      WasmEdge_FunctionTypeGetParameters(
          type, param_types.data(), param_types.size());
      WasmEdge_FunctionTypeGetReturns(type, ret_types.data(), ret_types.size());
      if (param_types.size() != args.size() or ret_types.size() > 1) {
        SL_WARN(log_, "Unexpected signature of export '{}'", name);
        return Error::INVALID_SIGNATURE;
      }

      std::vector<WasmEdge_Value> params;
      params.reserve(args.size());
      for (size_t i = 0; i < args.size(); ++i) {
        if (WasmEdge_ValTypeIsI32(param_types[i])) {
          params.push_back(
              WasmEdge_ValueGenI32(static_cast<int32_t>(args[i])));
        } else if (WasmEdge_ValTypeIsI64(param_types[i])) {
          params.push_back(
              WasmEdge_ValueGenI64(static_cast<int64_t>(args[i])));
        } else {
          return Error::INVALID_SIGNATURE;
        }
      }
      std::vector<WasmEdge_Value> returns(ret_types.size());

      SL_TRACE(log_, "Invoke '{}' of instance {}", name, fmt::ptr(this));
      auto res = WasmEdge_ExecutorInvoke(executor_.raw(),
                                         func,
                                         params.data(),
                                         params.size(),
                                         returns.data(),
                                         returns.size());
      if (not WasmEdge_ResultOK(res)) {
        SL_DEBUG(log_,
                 "Call of '{}' trapped: {}",
                 name,
                 WasmEdge_ResultGetMessage(res));
        return make_error_code(res);
      }

      if (returns.empty()) {
        return std::nullopt;
      }
      if (WasmEdge_ValTypeIsI32(ret_types[0])) {
        return static_cast<WasmValue>(
            static_cast<uint32_t>(WasmEdge_ValueGetI32(returns[0])));
      }
      if (WasmEdge_ValTypeIsI64(ret_types[0])) {
        return static_cast<WasmValue>(WasmEdge_ValueGetI64(returns[0]));
      }
      return Error::INVALID_CALL_RESULT;
    }

    std::shared_ptr<MemoryProvider> memoryProvider() const override {
      return memory_provider_;
    }

   private:
    const WasmEdge_FunctionInstanceContext *findFunction(
        std::string_view name) const {
      if (instance_ == nullptr) {
        return nullptr;
      }
      String wasm_name{name};
      return WasmEdge_ModuleInstanceFindFunction(instance_.raw(),
                                                 wasm_name.raw());
    }

    std::shared_ptr<const ModuleImpl> module_;
    std::unique_ptr<const std::vector<HostFunction>> functions_;
    StoreContext store_;
    ExecutorContext executor_;
    ModuleInstanceContext host_instance_;
    ModuleInstanceContext wasi_instance_;
    ModuleInstanceContext instance_;
    std::shared_ptr<MemoryProvider> memory_provider_;
    log::Logger log_ = log::createLogger("ModuleInstance", "wasm_edge");
  };

  class ModuleImpl : public Module,
                     public std::enable_shared_from_this<ModuleImpl> {
   public:
    explicit ModuleImpl(ASTModuleContext module) : module_{std::move(module)} {
      BOOST_ASSERT(not(module_ == nullptr));
    }

    outcome::result<std::shared_ptr<ModuleInstance>> instantiate(
        HostImports imports,
        std::shared_ptr<MemoryProvider> memory_provider) const override {
      auto functions = std::make_unique<const std::vector<HostFunction>>(
          std::move(imports.functions));
      auto host_instance = makeHostModule(*functions);
      ModuleInstanceContext wasi_instance;
      if (imports.wasi) {
        wasi_instance = makeWasiModule(*imports.wasi);
        if (wasi_instance == nullptr) {
          SL_ERROR(log_, "Failed to create WASI module");
          return make_error_code(WasmEdge_Result_Fail);
        }
      }

      auto instance = std::make_shared<ModuleInstanceImpl>(
          shared_from_this(),
          std::move(functions),
          StoreContext{WasmEdge_StoreCreate()},
          ExecutorContext{WasmEdge_ExecutorCreate(nullptr, nullptr)},
          std::move(host_instance),
          std::move(wasi_instance),
          std::move(memory_provider));
      OUTCOME_TRY(instance->instantiate(module_.raw()));
      instance->bindMemory();
      SL_DEBUG(log_, "Instantiated module {}", fmt::ptr(instance.get()));
      return instance;
    }

   private:
    ASTModuleContext module_;
    log::Logger log_ = log::createLogger("Module", "wasm_edge");
  };

  ModuleFactoryImpl::ModuleFactoryImpl()
      : log_{log::createLogger("ModuleFactory", "wasm_edge")} {}

  CompilationOutcome<std::shared_ptr<Module>> ModuleFactoryImpl::make(
      BufferView code) const {
    OUTCOME_TRY(configure_ctx, configureCtx());
    LoaderContext loader_ctx = WasmEdge_LoaderCreate(configure_ctx.raw());
    // NOLINTNEXTLINE(cppcoreguidelines-init-variables)
    WasmEdge_ASTModuleContext *module_ctx = nullptr;
    WasmEdge_UNWRAP_COMPILE_ERR(WasmEdge_LoaderParseFromBuffer(
        loader_ctx.raw(), &module_ctx, code.data(), code.size()));
    ASTModuleContext module = module_ctx;

    ValidatorContext validator = WasmEdge_ValidatorCreate(configure_ctx.raw());
    WasmEdge_UNWRAP_COMPILE_ERR(
        WasmEdge_ValidatorValidate(validator.raw(), module.raw()));

    SL_DEBUG(log_, "Loaded module of {} bytes", code.size());
    return std::make_shared<ModuleImpl>(std::move(module));
  }

}  // namespace lapphost::runtime::wasm_edge
