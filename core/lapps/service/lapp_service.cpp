/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "lapps/service/lapp_service.hpp"

#include <boost/asio/post.hpp>

namespace lapphost::lapps {

  ServiceSender::ServiceSender(std::shared_ptr<LappService> service)
      : service_{std::move(service)} {
    BOOST_ASSERT(service_);
  }

  void ServiceSender::deliver(Buffer message) const {
    service_->post(LappService::Deliver{std::move(message)});
  }

  std::future<bool> ServiceSender::stop() const {
    auto ack = std::make_shared<std::promise<bool>>();
    auto future = ack->get_future();
    service_->post(LappService::Stop{std::move(ack)});
    return future;
  }

  LappService::LappService(
      std::string lapp_name,
      std::weak_ptr<SharedLapp> lapp,
      std::shared_ptr<boost::asio::io_context> io_context,
      std::optional<std::chrono::milliseconds> lock_timeout)
      : lapp_name_{std::move(lapp_name)},
        lapp_{std::move(lapp)},
        io_context_{std::move(io_context)},
        strand_{boost::asio::make_strand(*io_context_)},
        lock_timeout_{lock_timeout},
        log_{log::createLogger(fmt::format("LappService:{}", lapp_name_),
                               "lapp_service")} {}

  ServiceSender LappService::spawn(
      std::string lapp_name,
      std::weak_ptr<SharedLapp> lapp,
      std::shared_ptr<boost::asio::io_context> io_context,
      std::optional<std::chrono::milliseconds> lock_timeout) {
    auto service = std::make_shared<LappService>(std::move(lapp_name),
                                                 std::move(lapp),
                                                 std::move(io_context),
                                                 lock_timeout);
    SL_DEBUG(service->log_, "Service started");
    return ServiceSender{std::move(service)};
  }

  void LappService::post(Message message) {
    boost::asio::post(
        strand_, [self{shared_from_this()}, message{std::move(message)}]() mutable {
          std::visit([&](auto &msg) { self->handle(msg); }, message);
        });
  }

  void LappService::handle(Deliver &deliver) {
    if (stopped_) {
      SL_TRACE(log_, "Message dropped, service is stopped");
      return;
    }
    auto lapp = lapp_.lock();
    if (not lapp) {
      SL_DEBUG(log_, "Lapp is gone, service stops");
      stopped_ = true;
      return;
    }

    auto route = [&](const Lapp &lapp) {
      return lapp.routeMessage(deliver.message);
    };
    outcome::result<std::optional<std::string>> res = LappError::LOCK_UNAVAILABLE;
    if (lock_timeout_) {
      if (auto routed = lapp->trySharedAccessFor(*lock_timeout_, route)) {
        res = std::move(*routed);
      }
    } else {
      res = lapp->sharedAccess(route);
    }

    if (not res) {
      SL_ERROR(log_, "Message routing failed: {}", res.error().message());
    } else if (res.value()) {
      SL_WARN(log_, "Lapp failed to handle message: {}", *res.value());
    }
  }

  void LappService::handle(Stop &stop) {
    bool was_running = not stopped_.exchange(true);
    if (was_running) {
      SL_DEBUG(log_, "Service stopped");
    }
    stop.ack->set_value(was_running);
  }

}  // namespace lapphost::lapps
