/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "log/logger.hpp"
#include "runtime/module_factory.hpp"

namespace lapphost::runtime::wasm_edge {

  /**
   * Makes lapp modules executed by the WasmEdge interpreter
   */
  class ModuleFactoryImpl : public ModuleFactory {
   public:
    ModuleFactoryImpl();

    CompilationOutcome<std::shared_ptr<Module>> make(
        BufferView code) const override;

   private:
    log::Logger log_;
  };

}  // namespace lapphost::runtime::wasm_edge
