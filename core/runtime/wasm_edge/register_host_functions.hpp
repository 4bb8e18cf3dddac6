/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "runtime/host_function.hpp"
#include "runtime/wasm_edge/wrappers.hpp"

namespace lapphost::runtime::wasm_edge {

  WasmEdge_ValType toWasmEdgeType(ValueType type);

  /**
   * Creates the `env` host module exposing `functions`.
   * `functions` must outlive the returned module instance.
   */
  ModuleInstanceContext makeHostModule(
      const std::vector<HostFunction> &functions);

  /**
   * Creates the `wasi_snapshot_preview1` module with the only preopened
   * directory (if any) mapped to the guest root
   */
  ModuleInstanceContext makeWasiModule(const WasiConfig &config);

}  // namespace lapphost::runtime::wasm_edge
