/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host_api/impl/sleep_extension.hpp"

#include <algorithm>
#include <thread>

namespace lapphost::host_api {

  SleepExtension::SleepExtension()
      : logger_{log::createLogger("SleepExtension", "sleep_extension")} {}

  outcome::result<void> SleepExtension::invoke_sleep(uint64_t millis) const {
    auto duration = std::chrono::milliseconds(
        std::min<uint64_t>(millis, kMaxSleep.count()));
    if (duration.count() != static_cast<int64_t>(millis)) {
      SL_WARN(logger_,
              "Requested sleep of {} ms is capped to {} ms",
              millis,
              duration.count());
    }
    SL_TRACE(logger_, "Sleep for {} ms", duration.count());
    std::this_thread::sleep_for(duration);
    return outcome::success();
  }

}  // namespace lapphost::host_api
