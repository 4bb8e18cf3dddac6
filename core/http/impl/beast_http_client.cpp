/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "http/impl/beast_http_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>

#include "common/uri.hpp"
#include "utils/asio_ssl_context_client.hpp"

namespace lapphost::http {
  namespace beast = boost::beast;
  namespace asio = boost::asio;
  using tcp = asio::ip::tcp;

  namespace {
    using BeastRequest = beast::http::request<beast::http::vector_body<uint8_t>>;
    using BeastResponse =
        beast::http::response<beast::http::vector_body<uint8_t>>;

    /**
     * One request/response exchange. Each step continues the chain or
     * stores the error.
     */
    template <typename Stream>
    class Exchange : public std::enable_shared_from_this<Exchange<Stream>> {
     public:
      Exchange(std::unique_ptr<Stream> stream,
               BeastRequest request,
               std::string host,
               std::string port,
               log::Logger log)
          : stream_{std::move(stream)},
            resolver_{beast::get_lowest_layer(*stream_).get_executor()},
            request_{std::move(request)},
            host_{std::move(host)},
            port_{std::move(port)},
            log_{std::move(log)} {}

      void start(std::chrono::milliseconds timeout) {
        beast::get_lowest_layer(*stream_).expires_after(timeout);
        SL_TRACE(log_, "Resolve hostname {}", host_);
        resolver_.async_resolve(
            host_,
            port_,
            [self{this->shared_from_this()}](const beast::error_code &ec,
                                             tcp::resolver::results_type res) {
              if (self->failed(ec, "Can't resolve hostname")) {
                return;
              }
              self->connect(std::move(res));
            });
      }

      bool done() const {
        return done_;
      }

      const std::optional<beast::error_code> &error() const {
        return error_;
      }

      BeastResponse &response() {
        return response_;
      }

     private:
      bool failed(const beast::error_code &ec, std::string_view what) {
        if (not ec) {
          return false;
        }
        SL_DEBUG(log_, "{} ({}:{}): {}", what, host_, port_, ec.message());
        error_ = ec;
        done_ = true;
        return true;
      }

      void connect(tcp::resolver::results_type endpoints) {
        beast::get_lowest_layer(*stream_).async_connect(
            endpoints,
            [self{this->shared_from_this()}](const beast::error_code &ec,
                                             const tcp::endpoint &endpoint) {
              if (self->failed(ec, "Connection failed")) {
                return;
              }
              SL_TRACE(self->log_,
                       "Connected to {}:{}",
                       endpoint.address().to_string(),
                       endpoint.port());
              self->handshake();
            });
      }

      void handshake() {
        if constexpr (std::is_same_v<Stream, beast::tcp_stream>) {
          write();
        } else {
          stream_->async_handshake(
              asio::ssl::stream_base::client,
              [self{this->shared_from_this()}](const beast::error_code &ec) {
                if (self->failed(ec, "Handshake failed")) {
                  return;
                }
                self->write();
              });
        }
      }

      void write() {
        beast::http::async_write(
            *stream_,
            request_,
            [self{this->shared_from_this()}](const beast::error_code &ec,
                                             size_t) {
              if (self->failed(ec, "Request sending failed")) {
                return;
              }
              self->read();
            });
      }

      void read() {
        beast::http::async_read(
            *stream_,
            buffer_,
            response_,
            [self{this->shared_from_this()}](const beast::error_code &ec,
                                             size_t received) {
              if (self->failed(ec, "Response reception failed")) {
                return;
              }
              SL_TRACE(self->log_, "Response of {} bytes received", received);
              beast::error_code ignored;
              beast::get_lowest_layer(*self->stream_)
                  .socket()
                  .shutdown(tcp::socket::shutdown_both, ignored);
              self->done_ = true;
            });
      }

      std::unique_ptr<Stream> stream_;
      tcp::resolver resolver_;
      BeastRequest request_;
      std::string host_;
      std::string port_;
      log::Logger log_;
      beast::flat_buffer buffer_;
      BeastResponse response_;
      std::optional<beast::error_code> error_;
      bool done_ = false;
    };

    template <typename Stream>
    outcome::result<BeastResponse> run(asio::io_context &io_context,
                                       std::unique_ptr<Stream> stream,
                                       BeastRequest request,
                                       const common::Uri &uri,
                                       std::chrono::milliseconds timeout,
                                       const log::Logger &log) {
      auto exchange = std::make_shared<Exchange<Stream>>(
          std::move(stream),
          std::move(request),
          uri.Host,
          std::to_string(*uri.port()),
          log);
      exchange->start(timeout);
      io_context.run_for(timeout);
      if (not exchange->done()) {
        return HttpClientError::TIMEOUT;
      }
      if (auto &ec = exchange->error()) {
        if (*ec == beast::error::timeout) {
          return HttpClientError::TIMEOUT;
        }
        return std::error_code{*ec};
      }
      return std::move(exchange->response());
    }
  }  // namespace

  BeastHttpClient::BeastHttpClient()
      : log_{log::createLogger("HttpClient", "http")} {}

  outcome::result<Response> BeastHttpClient::send(
      const Request &request, std::chrono::milliseconds timeout) const {
    auto uri = common::Uri::parse(request.uri);
    if (uri.error().has_value()) {
      SL_DEBUG(log_,
               "Uri '{}' parsing failed: {}",
               request.uri,
               uri.error().value());
      return HttpClientError::INVALID_URI;
    }
    if (uri.Schema != "http" and uri.Schema != "https") {
      return HttpClientError::UNSUPPORTED_SCHEMA;
    }

    auto verb = beast::http::string_to_verb(request.method);
    if (verb == beast::http::verb::unknown) {
      return HttpClientError::INVALID_METHOD;
    }

    BeastRequest req{verb, uri.target(), 11};
    req.set(beast::http::field::host, uri.Host);
    req.set(beast::http::field::user_agent, "lapphost");
    req.set(beast::http::field::connection, "close");
    for (const auto &header : request.headers) {
      if (header.name.empty()) {
        return HttpClientError::INVALID_HEADER;
      }
      req.set(header.name, header.value);
    }
    req.body() = request.body;
    req.prepare_payload();

    SL_DEBUG(log_, "{} {}", request.method, uri.toString());

    asio::io_context io_context;
    outcome::result<BeastResponse> res = HttpClientError::TIMEOUT;
    if (uri.isSecure()) {
      AsioSslContextClient ssl_ctx{uri.Host};
      using SslStream = beast::ssl_stream<beast::tcp_stream>;
      auto stream = std::make_unique<SslStream>(io_context, ssl_ctx);
      // SNI hostname, many hosts need it to handshake successfully
      if (not SSL_set_tlsext_host_name(stream->native_handle(),
                                       uri.Host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()),
                             asio::error::get_ssl_category()};
        SL_DEBUG(log_, "Can't set SNI hostname {}: {}", uri.Host, ec.message());
        return std::error_code{ec};
      }
      res = run(
          io_context, std::move(stream), std::move(req), uri, timeout, log_);
    } else {
      res = run(io_context,
                std::make_unique<beast::tcp_stream>(io_context),
                std::move(req),
                uri,
                timeout,
                log_);
    }
    OUTCOME_TRY(beast_response, std::move(res));

    Response response;
    response.status = static_cast<uint16_t>(beast_response.result_int());
    for (const auto &field : beast_response) {
      auto name = field.name_string();
      auto value = field.value();
      response.headers.push_back(Header{std::string(name.data(), name.size()),
                                        std::string(value.data(), value.size())});
    }
    response.body = std::move(beast_response.body());
    SL_DEBUG(log_,
             "{} {} -> {} ({} bytes)",
             request.method,
             uri.toString(),
             response.status,
             response.body.size());
    return response;
  }

}  // namespace lapphost::http
