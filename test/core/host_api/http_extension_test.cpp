/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host_api/impl/http_extension.hpp"

#include <gmock/gmock.h>

#include "mock/core/http/http_client_mock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/runtime/memory.hpp"

using lapphost::host_api::HttpExtension;
using lapphost::host_api::HttpResult;
using lapphost::http::HttpClientError;
using lapphost::http::HttpClientMock;
using lapphost::http::Request;
using lapphost::http::Response;
using lapphost::lapps::HttpSettings;
using lapphost::runtime::TestMemory;
using std::chrono::milliseconds;
using testing::_;
using testing::Field;
using testing::Return;

class HttpExtensionTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  std::unique_ptr<HttpExtension> makeExtension(HttpSettings settings) {
    return std::make_unique<HttpExtension>(
        client_, std::move(settings), kDefaultTimeout, memory_.provider);
  }

 protected:
  static constexpr milliseconds kDefaultTimeout{30000};

  std::shared_ptr<HttpClientMock> client_ = std::make_shared<HttpClientMock>();
  TestMemory memory_;
  Request request_{
      .method = "get",
      .uri = "https://example.com/api?x=1",
      .headers = {{"accept", "*/*"}},
      .body = {},
  };
};

/**
 * @given no restrictions in settings
 * @when a request is made
 * @then it is sent with upper case method and default timeout
 */
TEST_F(HttpExtensionTest, SendsWithDefaults) {
  Response response{.status = 201, .headers = {}, .body = {'o', 'k'}};
  EXPECT_CALL(*client_,
              send(Field(&Request::method, "GET"), kDefaultTimeout))
      .WillOnce(Return(response));
  EXPECT_EQ(makeExtension({})->invoke(request_), HttpResult::ok(response));
}

TEST_F(HttpExtensionTest, TimeoutFromSettings) {
  HttpSettings settings;
  settings.timeout = milliseconds{100};
  EXPECT_CALL(*client_, send(_, milliseconds{100}))
      .WillOnce(Return(make_error_code(HttpClientError::TIMEOUT)));
  auto res = makeExtension(settings)->invoke(request_);
  ASSERT_TRUE(res.isFailure());
  EXPECT_EQ(res.error(),
            make_error_code(HttpClientError::TIMEOUT).message());
}

TEST_F(HttpExtensionTest, MethodNotAllowed) {
  HttpSettings settings;
  settings.methods = std::set<std::string>{"POST"};
  EXPECT_CALL(*client_, send(_, _)).Times(0);
  auto res = makeExtension(settings)->invoke(request_);
  ASSERT_TRUE(res.isFailure());
  EXPECT_EQ(res.error(), "Method GET is not allowed");
}

TEST_F(HttpExtensionTest, HostNotAllowed) {
  HttpSettings settings;
  settings.hosts = std::set<std::string>{"api.example.org"};
  EXPECT_CALL(*client_, send(_, _)).Times(0);
  auto res = makeExtension(settings)->invoke(request_);
  ASSERT_TRUE(res.isFailure());
  EXPECT_EQ(res.error(), "Host example.com is not allowed");
}

TEST_F(HttpExtensionTest, InvalidUri) {
  EXPECT_CALL(*client_, send(_, _)).Times(0);
  request_.uri = "not a uri";
  EXPECT_TRUE(makeExtension({})->invoke(request_).isFailure());
}

/**
 * @given a request stored in lapp memory
 * @when the lapp calls invoke_http
 * @then the encoded result is returned in lapp memory
 */
TEST_F(HttpExtensionTest, HostFunction) {
  Response response{.status = 200, .headers = {}, .body = {}};
  EXPECT_CALL(*client_, send(Field(&Request::uri, request_.uri), _))
      .WillOnce(Return(response));
  auto extension = makeExtension({});
  auto arg = memory_.storeEncoded(request_);
  EXPECT_OUTCOME_TRUE(res, extension->invoke_http(arg));
  EXPECT_EQ(memory_.takeDecoded<HttpResult>(res), HttpResult::ok(response));
  EXPECT_TRUE(memory_.allocated.empty());
}
