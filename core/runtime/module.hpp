/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "outcome/outcome.hpp"
#include "runtime/host_function.hpp"

namespace lapphost::runtime {

  class ModuleInstance;
  class MemoryProvider;

  /**
   * A parsed and validated WebAssembly module of a lapp.
   * Contains a set of exported objects (e. g. functions and memory) and
   * imported objects (host functions and WASI).
   */
  class Module {
   public:
    virtual ~Module() = default;

    /**
     * Binds the module to `imports` and runs its start section.
     * Fails if the module imports anything `imports` does not provide.
     * On success `memory_provider` is bound to the instance memory and is
     * reset when the instance is destroyed.
     */
    virtual outcome::result<std::shared_ptr<ModuleInstance>> instantiate(
        HostImports imports,
        std::shared_ptr<MemoryProvider> memory_provider) const = 0;
  };
}  // namespace lapphost::runtime
