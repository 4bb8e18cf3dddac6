/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <array>
#include <iostream>

#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>
#include <boost/program_options.hpp>

namespace {
  namespace fs = lapphost::filesystem;

  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  const std::string def_lapps_dir = "lapps";
}  // namespace

namespace lapphost::application {

  AppConfigurationImpl::AppConfigurationImpl()
      : logger_{log::createLogger("AppConfiguration", "application")},
        lapps_dir_{def_lapps_dir} {}

  AppConfigurationImpl::FilePtr AppConfigurationImpl::open_file(
      const std::string &filepath) {
    BOOST_ASSERT(not filepath.empty());
    return AppConfigurationImpl::FilePtr(std::fopen(filepath.c_str(), "r"),
                                         &std::fclose);
  }

  bool AppConfigurationImpl::load_ms(const rapidjson::Value &val,
                                     const char *name,
                                     std::vector<std::string> &target) {
    auto m = val.FindMember(name);
    if (m == val.MemberEnd()) {
      return false;
    }
    if (m->value.IsString()) {
      target.emplace_back(m->value.GetString(), m->value.GetStringLength());
    } else if (m->value.IsArray()) {
      for (auto &v : m->value.GetArray()) {
        if (v.IsString()) {
          target.emplace_back(v.GetString(), v.GetStringLength());
        }
      }
    }
    return not target.empty();
  }

  bool AppConfigurationImpl::load_str(const rapidjson::Value &val,
                                      const char *name,
                                      std::string &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() != m && m->value.IsString()) {
      target.assign(m->value.GetString(), m->value.GetStringLength());
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_u32(const rapidjson::Value &val,
                                      const char *name,
                                      uint32_t &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsUint()) {
      target = m->value.GetUint();
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_millis(
      const rapidjson::Value &val,
      const char *name,
      std::optional<std::chrono::milliseconds> &target) {
    uint32_t millis = 0;
    if (load_u32(val, name, millis)) {
      target = std::chrono::milliseconds{millis};
      return true;
    }
    return false;
  }

  void AppConfigurationImpl::parse_general_segment(
      const rapidjson::Value &val) {
    load_ms(val, "log", logger_tuning_config_);
  }

  void AppConfigurationImpl::parse_lapps_segment(const rapidjson::Value &val) {
    std::string lapps_dir;
    if (load_str(val, "dir", lapps_dir)) {
      lapps_dir_ = lapps_dir;
    }
    load_millis(val, "lock-timeout-ms", lock_timeout_);
    std::optional<std::chrono::milliseconds> stop_timeout;
    if (load_millis(val, "service-stop-timeout-ms", stop_timeout)) {
      service_stop_timeout_ = *stop_timeout;
    }
  }

  void AppConfigurationImpl::parse_runtime_segment(
      const rapidjson::Value &val) {
    uint32_t threads = 0;
    if (load_u32(val, "threads", threads) and threads > 0) {
      threads_ = threads;
    }
  }

  void AppConfigurationImpl::parse_http_segment(const rapidjson::Value &val) {
    std::optional<std::chrono::milliseconds> timeout;
    if (load_millis(val, "timeout-ms", timeout)) {
      http_timeout_ = *timeout;
    }
  }

  bool AppConfigurationImpl::read_config_from_file(
      const std::string &filepath) {
    auto file = open_file(filepath);
    if (!file) {
      SL_ERROR(logger_,
               "Configuration file path is invalid: {}, "
               "please specify a valid path with -c option",
               filepath);
      return false;
    }

    using FileReadStream = rapidjson::FileReadStream;
    using Document = rapidjson::Document;

    std::array<char, 1024> buffer_size{};
    FileReadStream input_stream(
        file.get(), buffer_size.data(), buffer_size.size());

    Document document;
    document.ParseStream(input_stream);
    if (document.HasParseError() or not document.IsObject()) {
      SL_ERROR(logger_,
               "Configuration file {} parse failed with error {}",
               filepath,
               GetParseError_En(document.GetParseError()));
      return false;
    }

    for (auto &handler : handlers_) {
      auto it = document.FindMember(handler.segment_name);
      if (document.MemberEnd() != it and it->value.IsObject()) {
        handler.handler(it->value);
      }
    }
    return true;
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<target>=<level>`, e.g. -llapps=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all targets log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Path to a yaml config of the logging system")
        ("config-file,c", po::value<std::string>(), "Filepath to load configuration from.")
        ;

    po::options_description lapps_desc("Lapps options");
    lapps_desc.add_options()
        ("lapps-dir,d", po::value<std::string>()->default_value(def_lapps_dir), "directory with lapps, one subdirectory per lapp")
        ("lock-timeout-ms", po::value<uint32_t>(), "how long an operation waits for a busy lapp, waits forever if not set")
        ("service-stop-timeout-ms", po::value<uint32_t>()->default_value(kDefaultServiceStopTimeout.count()), "how long unload waits for a lapp service to stop")
        ;

    po::options_description runtime_desc("Runtime options");
    runtime_desc.add_options()
        ("threads", po::value<uint32_t>()->default_value(kDefaultThreads), "number of worker threads")
        ;

    po::options_description http_desc("Http options");
    http_desc.add_options()
        ("http-timeout-ms", po::value<uint32_t>()->default_value(kDefaultHttpTimeout.count()), "default timeout of outbound http requests of lapps")
        ;
    // clang-format on

    desc.add(lapps_desc).add(runtime_desc).add(http_desc);

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (vm.count("help") > 0) {
      std::cout << desc << std::endl;
      return false;
    }

    bool config_ok = true;
    find_argument<std::string>(vm, "config-file", [&](const std::string &path) {
      config_ok = read_config_from_file(path);
    });
    if (not config_ok) {
      return false;
    }

    find_argument<std::vector<std::string>>(
        vm, "log", [&](const std::vector<std::string> &val) {
          logger_tuning_config_.insert(
              logger_tuning_config_.end(), val.begin(), val.end());
        });

    find_argument<std::string>(vm, "lapps-dir", [&](const std::string &val) {
      lapps_dir_ = val;
    });
    find_argument<uint32_t>(vm, "lock-timeout-ms", [&](uint32_t val) {
      lock_timeout_ = std::chrono::milliseconds{val};
    });
    find_argument<uint32_t>(vm, "service-stop-timeout-ms", [&](uint32_t val) {
      service_stop_timeout_ = std::chrono::milliseconds{val};
    });
    find_argument<uint32_t>(vm, "threads", [&](uint32_t val) {
      if (val == 0) {
        SL_WARN(logger_, "Zero threads requested, using {}", threads_);
        return;
      }
      threads_ = val;
    });
    find_argument<uint32_t>(vm, "http-timeout-ms", [&](uint32_t val) {
      http_timeout_ = std::chrono::milliseconds{val};
    });

    lapps_dir_ = fs::absolute(lapps_dir_);
    if (not fs::is_directory(lapps_dir_)) {
      SL_ERROR(logger_,
               "Lapps directory {} does not exist",
               lapps_dir_.string());
      return false;
    }

    SL_DEBUG(logger_,
             "Lapps dir {}, threads {}, http timeout {}ms",
             lapps_dir_.string(),
             threads_,
             http_timeout_.count());
    return true;
  }

}  // namespace lapphost::application
