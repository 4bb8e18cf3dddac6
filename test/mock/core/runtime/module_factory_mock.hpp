/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "runtime/module_factory.hpp"

#include <gmock/gmock.h>

namespace lapphost::runtime {

  class ModuleFactoryMock final : public ModuleFactory {
   public:
    MOCK_METHOD(CompilationOutcome<std::shared_ptr<Module>>,
                make,
                (BufferView),
                (const, override));
  };

}  // namespace lapphost::runtime
