/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/lapphost_application.hpp"

#include <memory>

#include "application/app_configuration.hpp"
#include "log/logger.hpp"

namespace lapphost {
  class ThreadPool;
}

namespace lapphost::lapps {
  class LappsManager;
}

namespace lapphost::application {

  class LapphostApplicationImpl final : public LapphostApplication {
   public:
    explicit LapphostApplicationImpl(
        std::shared_ptr<const AppConfiguration> app_config);

    ~LapphostApplicationImpl() override;

    int run() override;

   private:
    std::shared_ptr<const AppConfiguration> app_config_;
    std::shared_ptr<ThreadPool> thread_pool_;
    std::shared_ptr<lapps::LappsManager> lapps_manager_;
    log::Logger logger_;
  };

}  // namespace lapphost::application
