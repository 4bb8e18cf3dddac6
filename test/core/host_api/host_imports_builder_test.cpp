/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host_api/host_imports_builder.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include "mock/core/http/http_client_mock.hpp"
#include "runtime/memory_provider.hpp"
#include "testutil/outcome.hpp"
#include "testutil/outcome/dummy_error.hpp"
#include "testutil/prepare_loggers.hpp"

using lapphost::filesystem::path;
using lapphost::host_api::HostImportsBuilder;
using lapphost::host_api::ImportsContext;
using lapphost::http::HttpClientMock;
using lapphost::lapps::Capabilities;
using lapphost::lapps::LappSettings;
using lapphost::lapps::Permission;
using lapphost::runtime::HostImports;
using lapphost::runtime::MemoryProvider;
using testutil::DummyError;

class HostImportsBuilderTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    root_ = lapphost::filesystem::temp_directory_path()
          / ("lapphost_imports_test_" + std::to_string(::getpid()));
    lapphost::filesystem::create_directories(root_);
  }

  void TearDown() override {
    lapphost::filesystem::remove_all(root_);
  }

  ImportsContext context(std::set<Permission> required,
                         const std::set<Permission> &allowed) {
    LappSettings settings;
    settings.permissions = Capabilities{std::move(required), allowed};
    settings.database.path = "lapp.db";
    return ImportsContext{
        .root_dir = root_,
        .settings = std::move(settings),
        .http_client = std::make_shared<HttpClientMock>(),
        .http_timeout = std::chrono::seconds{1},
        .memory_provider = std::make_shared<MemoryProvider>(),
    };
  }

 protected:
  path root_;
  HostImportsBuilder builder_;
};

/**
 * @given a lapp granted only the database
 * @when its imports are built
 * @then exactly the database functions are provided without filesystem
 */
TEST_F(HostImportsBuilderTest, DatabaseOnly) {
  EXPECT_OUTCOME_TRUE(imports,
                      builder_.build(context({Permission::Database},
                                             {Permission::Database})));
  ASSERT_EQ(imports.functions.size(), 3);
  EXPECT_TRUE(imports.hasFunction("db_execute"));
  EXPECT_TRUE(imports.hasFunction("db_query"));
  EXPECT_TRUE(imports.hasFunction("db_query_row"));
  EXPECT_FALSE(imports.hasFunction("invoke_http"));
  EXPECT_FALSE(imports.hasFunction("invoke_sleep"));
  EXPECT_FALSE(imports.wasi.has_value());
  EXPECT_TRUE(lapphost::filesystem::exists(root_ / "lapp.db"));
}

/**
 * @given a lapp requiring file read and database, granted only file read
 * @when its imports are built
 * @then no database function is provided and data dir is read only
 */
TEST_F(HostImportsBuilderTest, RequiredButNotGranted) {
  EXPECT_OUTCOME_TRUE(
      imports,
      builder_.build(context({Permission::FileRead, Permission::Database},
                             {Permission::FileRead})));
  EXPECT_TRUE(imports.functions.empty());
  ASSERT_TRUE(imports.wasi.has_value());
  ASSERT_TRUE(imports.wasi->preopen.has_value());
  EXPECT_EQ(imports.wasi->preopen->host_dir, (root_ / "data").string());
  EXPECT_TRUE(imports.wasi->preopen->readonly);
  EXPECT_TRUE(lapphost::filesystem::is_directory(root_ / "data"));
}

/**
 * @given FileWrite is granted and FileRead is not
 * @when imports are built
 * @then the data dir is preopened writable, which also makes it readable
 */
TEST_F(HostImportsBuilderTest, FileWriteGranted) {
  EXPECT_OUTCOME_TRUE(
      imports,
      builder_.build(context({Permission::FileRead, Permission::FileWrite},
                             {Permission::FileWrite})));
  ASSERT_TRUE(imports.wasi.has_value());
  ASSERT_TRUE(imports.wasi->preopen.has_value());
  EXPECT_FALSE(imports.wasi->preopen->readonly);
}

/**
 * @given file permissions are required but none is granted
 * @when imports are built
 * @then filesystem imports exist with no directory visible
 */
TEST_F(HostImportsBuilderTest, FileRequiredNothingGranted) {
  EXPECT_OUTCOME_TRUE(imports,
                      builder_.build(context({Permission::FileRead}, {})));
  ASSERT_TRUE(imports.wasi.has_value());
  EXPECT_FALSE(imports.wasi->preopen.has_value());
}

TEST_F(HostImportsBuilderTest, HttpAndSleep) {
  EXPECT_OUTCOME_TRUE(
      imports,
      builder_.build(context({Permission::Http, Permission::Sleep},
                             {Permission::Http, Permission::Sleep})));
  EXPECT_EQ(imports.functions.size(), 2);
  EXPECT_TRUE(imports.hasFunction("invoke_http"));
  EXPECT_TRUE(imports.hasFunction("invoke_sleep"));
  EXPECT_FALSE(imports.wasi.has_value());
}

TEST_F(HostImportsBuilderTest, RegistrarFailure) {
  HostImportsBuilder builder{{
      {Permission::Sleep,
       [](const ImportsContext &, HostImports &)
           -> lapphost::outcome::result<void> { return DummyError::ERROR; }},
  }};
  EXPECT_EC(builder.build(context({Permission::Sleep}, {Permission::Sleep})),
            DummyError::ERROR);
  EXPECT_OUTCOME_TRUE(imports,
                      builder.build(context({Permission::Sleep}, {})));
  EXPECT_TRUE(imports.functions.empty());
}
