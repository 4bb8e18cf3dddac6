/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "lapps/lapps_manager.hpp"

#include <future>

#include "lapps/service/lapp_service.hpp"

namespace lapphost::lapps {

  LappsManager::LappsManager(
      Config config,
      std::shared_ptr<const LappLoader> loader,
      std::shared_ptr<boost::asio::io_context> io_context)
      : config_{std::move(config)},
        loader_{std::move(loader)},
        io_context_{std::move(io_context)},
        log_{log::createLogger("LappsManager", "lapps_manager")} {
    BOOST_ASSERT(loader_);
    BOOST_ASSERT(io_context_);
  }

  template <typename F>
  auto LappsManager::exclusive(SharedLapp &lapp, F &&f) const
      -> std::invoke_result_t<F, Lapp &> {
    if (not config_.lock_timeout) {
      return lapp.exclusiveAccess(std::forward<F>(f));
    }
    auto res =
        lapp.tryExclusiveAccessFor(*config_.lock_timeout, std::forward<F>(f));
    if (not res) {
      return make_error_code(LappError::LOCK_UNAVAILABLE);
    }
    return std::move(*res);
  }

  template <typename F>
  auto LappsManager::shared(const SharedLapp &lapp, F &&f) const
      -> std::invoke_result_t<F, const Lapp &> {
    if (not config_.lock_timeout) {
      return lapp.sharedAccess(std::forward<F>(f));
    }
    auto res =
        lapp.trySharedAccessFor(*config_.lock_timeout, std::forward<F>(f));
    if (not res) {
      return make_error_code(LappError::LOCK_UNAVAILABLE);
    }
    return std::move(*res);
  }

  outcome::result<size_t> LappsManager::discover() {
    std::error_code ec;
    filesystem::directory_iterator it{config_.lapps_dir, ec};
    if (ec) {
      SL_ERROR(log_,
               "Can't read lapps dir {}: {}",
               config_.lapps_dir.string(),
               ec.message());
      return ec;
    }
    size_t count = 0;
    for (const auto &entry : it) {
      if (not entry.is_directory()) {
        continue;
      }
      insertLapp(entry.path().filename().string());
      ++count;
    }
    SL_INFO(log_,
            "Found {} lapps in {}",
            count,
            config_.lapps_dir.string());
    return count;
  }

  void LappsManager::insertLapp(const std::string &name) {
    auto lapp =
        std::make_shared<SharedLapp>(name, config_.lapps_dir / name, loader_);
    lapps_.exclusiveAccess(
        [&](auto &lapps) { lapps.insert_or_assign(name, std::move(lapp)); });
  }

  void LappsManager::insertLapp(const std::string &name,
                                LappSettings settings) {
    auto lapp = std::make_shared<SharedLapp>(
        name, config_.lapps_dir / name, std::move(settings), loader_);
    lapps_.exclusiveAccess(
        [&](auto &lapps) { lapps.insert_or_assign(name, std::move(lapp)); });
  }

  outcome::result<std::shared_ptr<SharedLapp>> LappsManager::lapp(
      const std::string &name) const {
    auto lapp = lapps_.sharedAccess(
        [&](const auto &lapps) -> std::shared_ptr<SharedLapp> {
          auto it = lapps.find(name);
          if (it == lapps.end()) {
            return nullptr;
          }
          return it->second;
        });
    if (not lapp) {
      return LappError::NOT_FOUND;
    }
    return lapp;
  }

  std::vector<std::string> LappsManager::lappNames() const {
    return lapps_.sharedAccess([](const auto &lapps) {
      std::vector<std::string> names;
      names.reserve(lapps.size());
      for (const auto &[name, _] : lapps) {
        names.emplace_back(name);
      }
      return names;
    });
  }

  void LappsManager::loadLapps() {
    for (const auto &name : lappNames()) {
      auto lapp_res = lapp(name);
      if (not lapp_res) {
        continue;
      }
      auto res = exclusive(
          *lapp_res.value(), [](Lapp &lapp) -> LoadOutcome<void> {
            if (lapp.isMain() or not lapp.isEnabled() or lapp.isLoaded()) {
              return outcome::success();
            }
            return lapp.load();
          });
      if (not res) {
        SL_ERROR(log_,
                 "Lapp {} is not loaded: {}",
                 name,
                 res.error().message());
      }
    }
  }

  LoadOutcome<void> LappsManager::load(const std::string &name) {
    auto lapp_res = lapp(name);
    if (not lapp_res) {
      return LoadError{lapp_res.error()};
    }
    return exclusive(*lapp_res.value(),
                     [](Lapp &lapp) -> LoadOutcome<void> { return lapp.load(); });
  }

  outcome::result<void> LappsManager::unload(const std::string &name) {
    OUTCOME_TRY(shared_lapp, lapp(name));
    OUTCOME_TRY(sender,
                exclusive(*shared_lapp,
                          [](Lapp &lapp)
                              -> outcome::result<std::optional<ServiceSender>> {
                            return lapp.unload();
                          }));
    if (sender) {
      awaitStop(name, *sender);
    }
    return outcome::success();
  }

  void LappsManager::unloadAll() {
    for (const auto &name : lappNames()) {
      if (auto res = unload(name); not res) {
        SL_ERROR(log_,
                 "Lapp {} is not unloaded: {}",
                 name,
                 res.error().message());
      }
    }
  }

  outcome::result<UpdateQuery> LappsManager::update(const std::string &name,
                                                    const UpdateQuery &query) {
    OUTCOME_TRY(shared_lapp, lapp(name));
    return exclusive(*shared_lapp, [&](Lapp &lapp) { return lapp.update(query); });
  }

  outcome::result<http::Response> LappsManager::processHttp(
      const std::string &name, const http::Request &request) {
    OUTCOME_TRY(shared_lapp, lapp(name));
    return shared(*shared_lapp, [&](const Lapp &lapp) {
      return lapp.processHttp(request);
    });
  }

  outcome::result<ServiceSender> LappsManager::runServiceIfNeeded(
      const std::string &name) {
    OUTCOME_TRY(shared_lapp, lapp(name));
    std::weak_ptr<SharedLapp> weak_lapp = shared_lapp;
    return exclusive(
        *shared_lapp, [&](Lapp &lapp) -> outcome::result<ServiceSender> {
          if (auto &sender = lapp.serviceSender()) {
            return *sender;
          }
          auto sender = LappService::spawn(
              name, weak_lapp, io_context_, config_.lock_timeout);
          lapp.setServiceSender(sender);
          return sender;
        });
  }

  outcome::result<bool> LappsManager::stopService(const std::string &name) {
    OUTCOME_TRY(shared_lapp, lapp(name));
    OUTCOME_TRY(sender,
                exclusive(*shared_lapp,
                          [](Lapp &lapp)
                              -> outcome::result<std::optional<ServiceSender>> {
                            return lapp.takeServiceSender();
                          }));
    if (not sender) {
      return false;
    }
    return awaitStop(name, *sender);
  }

  outcome::result<void> LappsManager::deliver(const std::string &name,
                                              Buffer message) {
    OUTCOME_TRY(sender, runServiceIfNeeded(name));
    sender.deliver(std::move(message));
    return outcome::success();
  }

  bool LappsManager::awaitStop(const std::string &name,
                               const ServiceSender &sender) const {
    auto ack = sender.stop();
    if (ack.wait_for(config_.service_stop_timeout)
        != std::future_status::ready) {
      SL_WARN(log_, "Service of lapp {} did not stop in time", name);
      return false;
    }
    try {
      return ack.get();
    } catch (const std::future_error &e) {
      SL_WARN(log_, "Service of lapp {} failed to stop: {}", name, e.what());
      return false;
    }
  }

  std::vector<LappInfo> LappsManager::lappsInfo() const {
    std::vector<LappInfo> infos;
    for (const auto &name : lappNames()) {
      auto lapp_res = lapp(name);
      if (not lapp_res) {
        continue;
      }
      auto info = shared(
          *lapp_res.value(), [](const Lapp &lapp) -> outcome::result<LappInfo> {
            const auto &settings = lapp.settings();
            return LappInfo{
                .name = lapp.name(),
                .title = settings.application.title,
                .enabled = lapp.isEnabled(),
                .required_permissions =
                    settings.permissions.requiredPermissions(),
                .allowed_permissions = settings.permissions.allowedPermissions(),
                .loaded = lapp.isLoaded(),
                .service_running = lapp.serviceSender().has_value(),
            };
          });
      if (not info) {
        SL_WARN(log_, "Lapp {} is busy: {}", name, info.error().message());
        continue;
      }
      infos.emplace_back(std::move(info.value()));
    }
    return infos;
  }

}  // namespace lapphost::lapps
