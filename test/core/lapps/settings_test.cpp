/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "lapps/settings.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using lapphost::filesystem::path;
using lapphost::lapps::LappSettings;
using lapphost::lapps::Permission;
using lapphost::lapps::SettingsError;

class SettingsTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    dir_ = lapphost::filesystem::temp_directory_path()
         / ("lapphost_settings_test_" + std::to_string(::getpid()));
    lapphost::filesystem::create_directories(dir_);
  }

  void TearDown() override {
    lapphost::filesystem::remove_all(dir_);
  }

 protected:
  path dir_;
};

TEST_F(SettingsTest, ParseFull) {
  auto json = R"({
    "application": {"title": "Calc", "enabled": true},
    "permissions": {"required": ["file_read", "database", "http"],
                    "allowed": ["file_read", "http"]},
    "database": {"path": "calc.db"},
    "network": {
      "http": {"methods": ["get", "Post"], "hosts": "all", "timeout_ms": 5000},
      "gossipsub": {"addr": "/ip4/127.0.0.1", "dial_ports": [4001, 4002]}
    }
  })";
  EXPECT_OUTCOME_TRUE(settings, LappSettings::parse(json));
  EXPECT_EQ(settings.application.title, "Calc");
  EXPECT_TRUE(settings.application.enabled);
  EXPECT_EQ(settings.permissions.requiredPermissions(),
            (std::set{Permission::FileRead, Permission::Http, Permission::Database}));
  EXPECT_EQ(settings.permissions.allowedPermissions(),
            (std::set{Permission::FileRead, Permission::Http}));
  EXPECT_EQ(settings.database.path, "calc.db");
  EXPECT_TRUE(settings.network.http.isMethodAllowed("GET"));
  EXPECT_TRUE(settings.network.http.isMethodAllowed("POST"));
  EXPECT_FALSE(settings.network.http.isMethodAllowed("DELETE"));
  EXPECT_TRUE(settings.network.http.isHostAllowed("anything.org"));
  EXPECT_EQ(settings.network.http.timeout, std::chrono::milliseconds{5000});
  EXPECT_EQ(settings.network.gossipsub.dial_ports,
            (std::vector<uint16_t>{4001, 4002}));
}

/**
 * @given settings allowing a permission that is not required and an unknown
 * one
 * @when they are parsed
 * @then both are dropped
 */
TEST_F(SettingsTest, DropsUnrequiredAndUnknown) {
  auto json = R"({
    "permissions": {"required": ["sleep", "teleport"],
                    "allowed": ["sleep", "tcp", "teleport"]}
  })";
  EXPECT_OUTCOME_TRUE(settings, LappSettings::parse(json));
  EXPECT_EQ(settings.permissions.requiredPermissions(),
            std::set{Permission::Sleep});
  EXPECT_EQ(settings.permissions.allowedPermissions(),
            std::set{Permission::Sleep});
}

TEST_F(SettingsTest, MissingFieldsAreDefault) {
  EXPECT_OUTCOME_TRUE(settings, LappSettings::parse("{}"));
  EXPECT_EQ(settings, LappSettings{});
  EXPECT_FALSE(settings.application.enabled);
  EXPECT_TRUE(settings.network.http.isHostAllowed("example.com"));
}

TEST_F(SettingsTest, InvalidJson) {
  EXPECT_EC(LappSettings::parse("{\"application\":"),
            SettingsError::PARSE_FAILED);
  EXPECT_EC(LappSettings::parse("[]"), SettingsError::PARSE_FAILED);
  EXPECT_EC(LappSettings::parse(R"({"application": {"enabled": "yes"}})"),
            SettingsError::INVALID_VALUE);
}

/**
 * @given settings saved to a file
 * @when the file is loaded
 * @then the same settings are read
 */
TEST_F(SettingsTest, SaveAndLoad) {
  LappSettings settings;
  settings.application = {.title = "Chat", .enabled = true};
  settings.permissions = {{Permission::Websocket, Permission::ClientHttp},
                          {Permission::ClientHttp}};
  settings.database.path = "/var/lib/chat.db";
  settings.network.http.hosts = std::set<std::string>{"example.com"};
  settings.network.http.timeout = std::chrono::milliseconds{100};

  auto file = dir_ / LappSettings::kFileName;
  EXPECT_OUTCOME_TRUE_1(settings.save(file));
  EXPECT_OUTCOME_TRUE(loaded, LappSettings::load(file));
  EXPECT_EQ(loaded, settings);
}

TEST_F(SettingsTest, LoadMissingFile) {
  EXPECT_EC(LappSettings::load(dir_ / "absent.json"),
            SettingsError::READ_FAILED);
}
