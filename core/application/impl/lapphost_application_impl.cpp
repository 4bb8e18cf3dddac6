/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/lapphost_application_impl.hpp"

#include <csignal>
#include <cstdlib>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <unistd.h>

#include "api/lapps_json.hpp"
#include "host_api/host_imports_builder.hpp"
#include "http/impl/beast_http_client.hpp"
#include "lapps/lapp_loader.hpp"
#include "lapps/lapps_manager.hpp"
#include "runtime/wasm_edge/module_factory_impl.hpp"
#include "utils/thread_pool.hpp"

namespace lapphost::application {

  LapphostApplicationImpl::LapphostApplicationImpl(
      std::shared_ptr<const AppConfiguration> app_config)
      : app_config_{std::move(app_config)},
        logger_{log::createLogger("Application", "application")} {
    BOOST_ASSERT(app_config_);

    thread_pool_ =
        std::make_shared<ThreadPool>("worker", app_config_->threads());

    auto loader = std::make_shared<lapps::LappLoader>(
        std::make_shared<runtime::wasm_edge::ModuleFactoryImpl>(),
        std::make_shared<host_api::HostImportsBuilder>(),
        std::make_shared<http::BeastHttpClient>(),
        app_config_->httpTimeout());

    lapps_manager_ = std::make_shared<lapps::LappsManager>(
        lapps::LappsManager::Config{
            .lapps_dir = app_config_->lappsDir(),
            .lock_timeout = app_config_->lockTimeout(),
            .service_stop_timeout = app_config_->serviceStopTimeout(),
        },
        std::move(loader),
        thread_pool_->io_context());
  }

  LapphostApplicationImpl::~LapphostApplicationImpl() {
    // services must not outlive the pool
    lapps_manager_.reset();
    thread_pool_.reset();
  }

  int LapphostApplicationImpl::run() {
    logger_->info("Start with lapps from {} with PID {}",
                  app_config_->lappsDir().string(),
                  getpid());

    if (auto res = lapps_manager_->discover(); not res) {
      logger_->critical("Error reading lapps directory {}: {}",
                        app_config_->lappsDir().string(),
                        res.error().message());
      return EXIT_FAILURE;
    }
    lapps_manager_->loadLapps();
    SL_DEBUG(logger_,
             "Lapps: {}",
             api::lappsToJson(lapps_manager_->lappsInfo()));

    boost::asio::io_context main_context;
    boost::asio::signal_set signals{main_context, SIGINT, SIGTERM};
    signals.async_wait(
        [&](const boost::system::error_code &ec, int signal_number) {
          if (ec) {
            return;
          }
          SL_INFO(logger_, "Signal {} received, stopping", signal_number);
        });
    main_context.run();

    lapps_manager_->unloadAll();
    thread_pool_->stop();
    return EXIT_SUCCESS;
  }

}  // namespace lapphost::application
