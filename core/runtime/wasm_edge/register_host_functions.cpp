/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/wasm_edge/register_host_functions.hpp"

#include <exception>

#include <boost/assert.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "log/logger.hpp"

namespace lapphost::runtime::wasm_edge {

  WasmEdge_ValType toWasmEdgeType(ValueType type) {
    switch (type) {
      case ValueType::I32:
        return WasmEdge_ValTypeGenI32();
      case ValueType::I64:
        return WasmEdge_ValTypeGenI64();
    }
    BOOST_UNREACHABLE_RETURN(WasmEdge_ValTypeGenI64());
  }

  namespace {
    log::Logger &logger() {
      static auto logger = log::createLogger("HostFunction", "wasm_edge");
      return logger;
    }

    WasmValue fromWasmEdgeValue(ValueType type, const WasmEdge_Value &v) {
      if (type == ValueType::I32) {
        return static_cast<uint32_t>(WasmEdge_ValueGetI32(v));
      }
      return static_cast<uint64_t>(WasmEdge_ValueGetI64(v));
    }

    WasmEdge_Value toWasmEdgeValue(ValueType type, WasmValue v) {
      if (type == ValueType::I32) {
        return WasmEdge_ValueGenI32(static_cast<int32_t>(v));
      }
      return WasmEdge_ValueGenI64(static_cast<int64_t>(v));
    }

    WasmEdge_Result hostFunctionWrapper(void *data,
                                        const WasmEdge_CallingFrameContext *,
                                        const WasmEdge_Value *params,
                                        WasmEdge_Value *returns) {
      BOOST_ASSERT(data);
      const auto &function = *static_cast<const HostFunction *>(data);

      std::vector<WasmValue> args;
      args.reserve(function.params.size());
      for (size_t i = 0; i < function.params.size(); ++i) {
        args.push_back(fromWasmEdgeValue(function.params[i], params[i]));
      }

      try {
        auto res = function.body(args);
        if (not res) {
          SL_ERROR(logger(),
                   "Host function '{}' failed: {}",
                   function.name,
                   res.error().message());
          return WasmEdge_Result_Fail;
        }
        if (function.result) {
          if (not res.value()) {
            SL_ERROR(logger(),
                     "Host function '{}' returned no value",
                     function.name);
            return WasmEdge_Result_Fail;
          }
          returns[0] = toWasmEdgeValue(*function.result, *res.value());
        }
      } catch (const std::exception &e) {
        SL_ERROR(logger(),
                 "Host function '{}' failed with exception: {}",
                 function.name,
                 e.what());
        return WasmEdge_Result_Fail;
      }
      return WasmEdge_Result_Success;
    }
  }  // namespace

  ModuleInstanceContext makeHostModule(
      const std::vector<HostFunction> &functions) {
    String module_name{kHostModuleName};
    ModuleInstanceContext module{
        WasmEdge_ModuleInstanceCreate(module_name.raw())};

    for (const auto &function : functions) {
      std::vector<WasmEdge_ValType> params;
      params.reserve(function.params.size());
      for (auto type : function.params) {
        params.push_back(toWasmEdgeType(type));
      }
      std::vector<WasmEdge_ValType> rets;
      if (function.result) {
        rets.push_back(toWasmEdgeType(*function.result));
      }
      FunctionTypeContext type{WasmEdge_FunctionTypeCreate(
          params.data(), params.size(), rets.data(), rets.size())};
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
      auto instance = WasmEdge_FunctionInstanceCreate(
          type.raw(),
          &hostFunctionWrapper,
          const_cast<HostFunction *>(&function),
          0);

      String name{function.name};
      WasmEdge_ModuleInstanceAddFunction(module.raw(), name.raw(), instance);
      SL_TRACE(logger(), "Registered host function '{}'", function.name);
    }
    return module;
  }

  ModuleInstanceContext makeWasiModule(const WasiConfig &config) {
    std::vector<std::string> preopens;
    if (config.preopen) {
      preopens.emplace_back(
          fmt::format("/:{}{}",
                      config.preopen->host_dir,
                      config.preopen->readonly ? ":readonly" : ""));
    }
    std::vector<const char *> preopens_raw;
    preopens_raw.reserve(preopens.size());
    for (const auto &preopen : preopens) {
      preopens_raw.push_back(preopen.c_str());
    }
    SL_DEBUG(logger(),
             "Create WASI module with preopens [{}]",
             fmt::join(preopens, ", "));
    return ModuleInstanceContext{WasmEdge_ModuleInstanceCreateWASI(
        nullptr, 0, nullptr, 0, preopens_raw.data(), preopens_raw.size())};
  }

}  // namespace lapphost::runtime::wasm_edge
