/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <future>
#include <memory>

#include "common/buffer.hpp"

namespace lapphost::lapps {

  class LappService;

  /**
   * Mailbox endpoint of a lapp service, cheap to copy.
   * Messages are handled in the order they were sent.
   */
  class ServiceSender {
   public:
    explicit ServiceSender(std::shared_ptr<LappService> service);

    /// Routes `message` into the lapp
    void deliver(Buffer message) const;

    /**
     * Asks the service to finish
     * @return future acknowledgment, true once the service stopped
     */
    std::future<bool> stop() const;

    bool operator==(const ServiceSender &) const = default;

   private:
    std::shared_ptr<LappService> service_;
  };

}  // namespace lapphost::lapps
