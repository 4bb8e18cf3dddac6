/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "lapps/lapp_loader.hpp"

#include <gmock/gmock.h>

#include "host_api/host_imports_builder.hpp"
#include "mock/core/runtime/module_factory_mock.hpp"

namespace lapphost::lapps {

  class LappLoaderMock final : public LappLoader {
   public:
    LappLoaderMock()
        : LappLoader{std::make_shared<runtime::ModuleFactoryMock>(),
                     std::make_shared<host_api::HostImportsBuilder>(),
                     nullptr,
                     std::chrono::milliseconds{1000}} {}

    MOCK_METHOD(LoadOutcome<std::shared_ptr<runtime::ModuleInstance>>,
                load,
                (const LoadRequest &),
                (const, override));
  };

}  // namespace lapphost::lapps
