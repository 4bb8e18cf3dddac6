/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <variant>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include "lapps/lapp.hpp"
#include "log/logger.hpp"

namespace lapphost::lapps {

  /**
   * Background actor of one lapp.
   *
   * Runs on the shared pool, messages are serialized by its own strand.
   * The actor holds the lapp weakly and takes shared access to it only to
   * handle a delivery, so spawning and stopping it never takes the lapp
   * lock.
   */
  class LappService : public std::enable_shared_from_this<LappService> {
   public:
    struct Deliver {
      Buffer message;
    };
    struct Stop {
      std::shared_ptr<std::promise<bool>> ack;
    };
    using Message = std::variant<Deliver, Stop>;

    LappService(std::string lapp_name,
                std::weak_ptr<SharedLapp> lapp,
                std::shared_ptr<boost::asio::io_context> io_context,
                std::optional<std::chrono::milliseconds> lock_timeout);

    /// Creates an actor and returns its endpoint
    static ServiceSender spawn(
        std::string lapp_name,
        std::weak_ptr<SharedLapp> lapp,
        std::shared_ptr<boost::asio::io_context> io_context,
        std::optional<std::chrono::milliseconds> lock_timeout);

    void post(Message message);

   private:
    void handle(Deliver &deliver);
    void handle(Stop &stop);

    std::string lapp_name_;
    std::weak_ptr<SharedLapp> lapp_;
    std::shared_ptr<boost::asio::io_context> io_context_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    std::optional<std::chrono::milliseconds> lock_timeout_;
    std::atomic_bool stopped_ = false;
    log::Logger log_;
  };

}  // namespace lapphost::lapps
