/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

#include "log/logger.hpp"
#include "outcome/outcome.hpp"

namespace lapphost::host_api {

  /**
   * Blocks the calling lapp, never longer than `kMaxSleep`
   */
  class SleepExtension final {
   public:
    static constexpr std::chrono::milliseconds kMaxSleep{60'000};

    SleepExtension();

    outcome::result<void> invoke_sleep(uint64_t millis) const;

   private:
    log::Logger logger_;
  };

}  // namespace lapphost::host_api
