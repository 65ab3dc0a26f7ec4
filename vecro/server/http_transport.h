// Copyright 2025 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef VECRO_SERVER_HTTP_TRANSPORT_H
#define VECRO_SERVER_HTTP_TRANSPORT_H

#include "vecro/options.h"
#include "vecro/status.h"
#include "vecro/status_or.h"
#include "vecro/version.h"
#include "vecro/workload/internal/workload_endpoint.h"
#include "vecro/workload/workload_types.h"
#include "absl/types/optional.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace vecro {
namespace server {
VECRO_INLINE_NAMESPACE_BEGIN

/// The largest request body accepted by the server.
std::uint64_t constexpr kRequestBodySizeLimit = 32 * 1024;

/// The time allowed to read a complete request from a connection.
auto constexpr kRequestReadTimeout = std::chrono::seconds(30);

/// A parsed listen address. An empty host means all interfaces.
struct ListenAddress {
  std::string host;
  std::uint16_t port = 0;
};

/**
 * Parses a listen address.
 *
 * Accepts `host:port`, `[ipv6]:port`, `:port` and a bare `port`.
 * Anything else is a `kInvalidArgument` error.
 */
StatusOr<ListenAddress> ParseListenAddress(std::string const& address);

/**
 * Maps the inbound body to a workload request.
 *
 * The workload shape is server-side configuration, so the body carries no
 * parameters. It must be empty or a JSON object, anything else is a
 * `kInvalidArgument` error with reason `DECODE_FAILED`.
 */
StatusOr<workload::WorkloadRequest> DecodeWorkloadRequest(
    std::string const& body);

/// Encodes `{"bytes":N,"reads":R,"writes":W,"ok":B}`.
std::string EncodeWorkloadResponse(workload::WorkloadResponse const& response);

/// Encodes `{"error":{"code":"...","message":"..."}}`.
std::string EncodeError(Status const& status);

/// The HTTP status code returned for an error with @p code.
unsigned HttpStatusFromCode(StatusCode code);

/**
 * Handles a HTTP request.
 *
 * Every path except `/metrics` invokes the endpoint. The metrics are served
 * on a separate address, so `/metrics` answers 404.
 */
class HttpHandler {
 public:
  using Request = boost::beast::http::request<boost::beast::http::string_body>;
  using Response =
      boost::beast::http::response<boost::beast::http::string_body>;

  /// Uses `RequestTimeoutOption` and `MetricsAddressOption` from @p opts.
  HttpHandler(workload_internal::Endpoint endpoint,
              workload_internal::ResponseFinalizer finalizer,
              Options const& opts);

  Response HandleRequest(Request const& request);

 private:
  Response Invoke(Request const& request);
  Response MakeResponse(Request const& request, unsigned status,
                        std::string body) const;
  Response Finalize(workload::CallContext& context, Request const& request,
                    unsigned status, std::string body) const;

  workload_internal::Endpoint endpoint_;
  workload_internal::ResponseFinalizer finalizer_;
  std::chrono::seconds request_timeout_;
  std::string metrics_address_;
};

/// Reads requests from a connection, and writes the handler's responses.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket,
              std::shared_ptr<HttpHandler> handler)
      : stream_(std::move(socket)), handler_(std::move(handler)) {}

  void Start();

 private:
  void OnRead(boost::beast::error_code ec);
  void OnWrite(bool need_eof, boost::beast::error_code ec);
  void Close();

  boost::beast::tcp_stream stream_;
  std::shared_ptr<HttpHandler> handler_;
  boost::beast::flat_buffer buffer_;
  // Recreated for each request.
  absl::optional<boost::beast::http::request_parser<
      boost::beast::http::string_body>>
      parser_;
};

/// Accepts connections, each served by its own `HttpSession`.
class HttpAcceptor : public std::enable_shared_from_this<HttpAcceptor> {
 public:
  HttpAcceptor(boost::asio::io_context& ioc,
               std::shared_ptr<HttpHandler> handler);

  /// Opens, binds and listens on @p endpoint.
  Status Listen(boost::asio::ip::tcp::endpoint const& endpoint);

  /// The bound address, useful when listening on port 0.
  boost::asio::ip::tcp::endpoint local_endpoint() const;

  void Start();

 private:
  void OnAccept(boost::beast::error_code ec,
                boost::asio::ip::tcp::socket socket);

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor socket_acceptor_;
  std::shared_ptr<HttpHandler> handler_;
};

/**
 * Creates an acceptor listening on @p address.
 *
 * Host names are resolved, an empty host listens on all interfaces. Errors
 * are `kUnavailable` with reason `LISTEN_FAILED`.
 */
StatusOr<std::shared_ptr<HttpAcceptor>> MakeHttpAcceptor(
    boost::asio::io_context& ioc, ListenAddress const& address,
    std::shared_ptr<HttpHandler> handler);

VECRO_INLINE_NAMESPACE_END
}  // namespace server
}  // namespace vecro

#endif  // VECRO_SERVER_HTTP_TRANSPORT_H
