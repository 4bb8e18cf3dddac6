/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fstream>

#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "testutil/prepare_loggers.hpp"

using lapphost::application::AppConfigurationImpl;
using std::chrono::milliseconds;

class AppConfigurationTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  boost::filesystem::path tmp_dir = boost::filesystem::temp_directory_path()
                                  / boost::filesystem::unique_path();
  std::string config_path = (tmp_dir / "config.json").native();
  std::string damaged_config_path = (tmp_dir / "damaged_config.json").native();
  boost::filesystem::path lapps_path = tmp_dir / "lapps";
  boost::filesystem::path other_lapps_path = tmp_dir / "other_lapps";

  static constexpr char const *file_content =
      R"({
        "general" : {
          "log": ["lapps=debug", "runtime=trace"]
        },
        "lapps" : {
          "dir" : "%1%",
          "lock-timeout-ms" : 100,
          "service-stop-timeout-ms" : 200
        },
        "runtime" : {
          "threads" : 2
        },
        "http" : {
          "timeout-ms" : 300
        }
      })";
  static constexpr char const *damaged_file_content =
      R"({
        "lapps" : {
          "dir" : "lapps",
        "runtime" : imeout-ms" : 300
        }
      })";

  void SetUp() override {
    boost::filesystem::create_directory(tmp_dir);
    ASSERT_TRUE(boost::filesystem::exists(tmp_dir));
    ASSERT_TRUE(boost::filesystem::create_directory(lapps_path));
    ASSERT_TRUE(boost::filesystem::create_directory(other_lapps_path));

    auto spawn_file = [](std::string const &path,
                         std::string const &file_content) {
      std::ofstream file(path, std::ofstream::out | std::ofstream::trunc);
      file << file_content;
    };
    spawn_file(config_path,
               (boost::format(file_content) % lapps_path.native()).str());
    spawn_file(damaged_config_path, damaged_file_content);

    app_config_ = std::make_shared<AppConfigurationImpl>();
  }

  void TearDown() override {
    app_config_.reset();
    boost::filesystem::remove_all(tmp_dir);
  }

  std::shared_ptr<AppConfigurationImpl> app_config_;
};

/**
 * @given new created AppConfigurationImpl
 * @when only the lapps dir is provided
 * @then default values are used for the rest
 */
TEST_F(AppConfigurationTest, DefaultValues) {
  char const *args[] = {"/path/", "--lapps-dir", lapps_path.native().c_str()};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->lappsDir(), lapps_path.native());
  EXPECT_EQ(app_config_->threads(), AppConfigurationImpl::kDefaultThreads);
  EXPECT_EQ(app_config_->lockTimeout(), std::nullopt);
  EXPECT_EQ(app_config_->serviceStopTimeout(),
            AppConfigurationImpl::kDefaultServiceStopTimeout);
  EXPECT_EQ(app_config_->httpTimeout(),
            AppConfigurationImpl::kDefaultHttpTimeout);
  EXPECT_EQ(app_config_->log(), std::vector<std::string>());
}

TEST_F(AppConfigurationTest, CommandLine) {
  char const *args[] = {"/path/",
                        "-d",
                        lapps_path.native().c_str(),
                        "--threads",
                        "8",
                        "--lock-timeout-ms",
                        "10",
                        "--service-stop-timeout-ms",
                        "20",
                        "--http-timeout-ms",
                        "30",
                        "-llapps=trace",
                        "-lhttp=debug"};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->threads(), 8);
  EXPECT_EQ(app_config_->lockTimeout(), milliseconds{10});
  EXPECT_EQ(app_config_->serviceStopTimeout(), milliseconds{20});
  EXPECT_EQ(app_config_->httpTimeout(), milliseconds{30});
  EXPECT_EQ(app_config_->log(),
            (std::vector<std::string>{"lapps=trace", "http=debug"}));
}

/**
 * @given a config file with every segment
 * @when the file is the only argument
 * @then all values are taken from the file
 */
TEST_F(AppConfigurationTest, ConfigFile) {
  char const *args[] = {"/path/", "--config-file", config_path.c_str()};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->lappsDir(), lapps_path.native());
  EXPECT_EQ(app_config_->threads(), 2);
  EXPECT_EQ(app_config_->lockTimeout(), milliseconds{100});
  EXPECT_EQ(app_config_->serviceStopTimeout(), milliseconds{200});
  EXPECT_EQ(app_config_->httpTimeout(), milliseconds{300});
  EXPECT_EQ(app_config_->log(),
            (std::vector<std::string>{"lapps=debug", "runtime=trace"}));
}

TEST_F(AppConfigurationTest, CommandLineOverridesConfigFile) {
  char const *args[] = {"/path/",
                        "-c",
                        config_path.c_str(),
                        "--lapps-dir",
                        other_lapps_path.native().c_str(),
                        "--threads",
                        "3"};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  EXPECT_EQ(app_config_->lappsDir(), other_lapps_path.native());
  EXPECT_EQ(app_config_->threads(), 3);
  EXPECT_EQ(app_config_->lockTimeout(), milliseconds{100});
}

TEST_F(AppConfigurationTest, DamagedConfigFile) {
  char const *args[] = {"/path/", "-c", damaged_config_path.c_str()};
  EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}

TEST_F(AppConfigurationTest, MissingConfigFile) {
  auto missing = (tmp_dir / "absent.json").native();
  char const *args[] = {"/path/", "-c", missing.c_str()};
  EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}

TEST_F(AppConfigurationTest, MissingLappsDir) {
  auto missing = (tmp_dir / "absent").native();
  char const *args[] = {"/path/", "--lapps-dir", missing.c_str()};
  EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}

TEST_F(AppConfigurationTest, UnknownOption) {
  char const *args[] = {"/path/", "--rpc-port", "1"};
  EXPECT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}
