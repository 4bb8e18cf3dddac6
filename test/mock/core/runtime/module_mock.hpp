/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "runtime/module.hpp"

#include <gmock/gmock.h>

namespace lapphost::runtime {

  class ModuleMock final : public Module {
   public:
    MOCK_METHOD(outcome::result<std::shared_ptr<ModuleInstance>>,
                instantiate,
                (HostImports, std::shared_ptr<MemoryProvider>),
                (const, override));
  };

}  // namespace lapphost::runtime
