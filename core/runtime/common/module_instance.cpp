/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/module_instance.hpp"

#include <array>

#include "runtime/memory_provider.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lapphost::runtime, ModuleInstance::Error, e) {
  using E = lapphost::runtime::ModuleInstance::Error;

  switch (e) {
    case E::EXPORT_NOT_FOUND:
      return "Export function not found in the lapp module";
    case E::INVALID_SIGNATURE:
      return "Export function signature does not match the call";
    case E::INVALID_CALL_RESULT:
      return "Export function returned an unexpected result";
  }
  return "Unknown ModuleInstance error";
}

namespace lapphost::runtime {

  log::Logger &ModuleInstance::log() {
    static auto log = log::createLogger("ModuleInstance", "runtime");
    return log;
  }

  outcome::result<Buffer> ModuleInstance::callExportFunction(
      std::string_view name, BufferView args) {
    std::lock_guard lock{mutex_};
    if (not hasExport(name)) {
      return Error::EXPORT_NOT_FOUND;
    }
    OUTCOME_TRY(memory, memoryProvider()->memory());
    OUTCOME_TRY(args_span, memory.get().storeBuffer(args));

    const std::array<WasmValue, 1> params{args_span};
    OUTCOME_TRY(result, invoke(name, params));
    if (not result) {
      SL_DEBUG(log(), "Export function '{}' returned nothing", name);
      return Error::INVALID_CALL_RESULT;
    }
    // the memory bridge may be gone if the call dropped the instance
    OUTCOME_TRY(memory_after, memoryProvider()->memory());
    return memory_after.get().take(*result);
  }

}  // namespace lapphost::runtime
