/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <cstdio>
#include <functional>
#include <memory>

#include <rapidjson/document.h>

#include "log/logger.hpp"

namespace lapphost::application {

  /**
   * Command line options with an optional json config file.
   * Values given on the command line override the config file.
   */
  class AppConfigurationImpl final : public AppConfiguration {
    using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

   public:
    static constexpr size_t kDefaultThreads = 4;
    static constexpr std::chrono::milliseconds kDefaultServiceStopTimeout{5000};
    static constexpr std::chrono::milliseconds kDefaultHttpTimeout{30000};

    AppConfigurationImpl();

    /**
     * @return false if the application should not run: help was requested
     * or arguments are invalid
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    const filesystem::path &lappsDir() const override {
      return lapps_dir_;
    }
    size_t threads() const override {
      return threads_;
    }
    std::optional<std::chrono::milliseconds> lockTimeout() const override {
      return lock_timeout_;
    }
    std::chrono::milliseconds serviceStopTimeout() const override {
      return service_stop_timeout_;
    }
    std::chrono::milliseconds httpTimeout() const override {
      return http_timeout_;
    }
    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }

   private:
    void parse_general_segment(const rapidjson::Value &val);
    void parse_lapps_segment(const rapidjson::Value &val);
    void parse_runtime_segment(const rapidjson::Value &val);
    void parse_http_segment(const rapidjson::Value &val);

    FilePtr open_file(const std::string &filepath);

    bool load_ms(const rapidjson::Value &val,
                 const char *name,
                 std::vector<std::string> &target);
    bool load_str(const rapidjson::Value &val,
                  const char *name,
                  std::string &target);
    bool load_u32(const rapidjson::Value &val,
                  const char *name,
                  uint32_t &target);
    bool load_millis(const rapidjson::Value &val,
                     const char *name,
                     std::optional<std::chrono::milliseconds> &target);

    bool read_config_from_file(const std::string &filepath);

    struct SegmentHandler {
      using Handler = std::function<void(rapidjson::Value &)>;
      char const *segment_name;
      Handler handler;
    };

    // clang-format off
    std::vector<SegmentHandler> handlers_ = {
        SegmentHandler{"general", std::bind(&AppConfigurationImpl::parse_general_segment, this, std::placeholders::_1)},
        SegmentHandler{"lapps",   std::bind(&AppConfigurationImpl::parse_lapps_segment, this, std::placeholders::_1)},
        SegmentHandler{"runtime", std::bind(&AppConfigurationImpl::parse_runtime_segment, this, std::placeholders::_1)},
        SegmentHandler{"http",    std::bind(&AppConfigurationImpl::parse_http_segment, this, std::placeholders::_1)},
    };
    // clang-format on

    log::Logger logger_;

    filesystem::path lapps_dir_;
    size_t threads_ = kDefaultThreads;
    std::optional<std::chrono::milliseconds> lock_timeout_;
    std::chrono::milliseconds service_stop_timeout_ =
        kDefaultServiceStopTimeout;
    std::chrono::milliseconds http_timeout_ = kDefaultHttpTimeout;
    std::vector<std::string> logger_tuning_config_;
  };

}  // namespace lapphost::application
