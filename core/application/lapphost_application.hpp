/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace lapphost::application {

  /**
   * @class LapphostApplication lapphost application interface
   */
  class LapphostApplication {
   public:
    virtual ~LapphostApplication() = default;

    /// Runs the host until SIGINT or SIGTERM
    virtual int run() = 0;
  };

}  // namespace lapphost::application
