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

#include "vecro/server/http_transport.h"
#include "vecro/internal/make_status.h"
#include "vecro/log.h"
#include "vecro/workload/call_context.h"
#include "vecro/workload/workload_options.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/types/any.h"
#include <boost/asio/ip/address.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/strand.hpp>
#include <nlohmann/json.hpp>
#include <limits>
#include <sstream>

namespace vecro {
namespace server {
VECRO_INLINE_NAMESPACE_BEGIN
namespace {

namespace be = ::boost::beast;
namespace asio = ::boost::asio;
using tcp = ::boost::asio::ip::tcp;

template <typename StringView>
std::string ToString(StringView sv) {
  return std::string(sv.data(), sv.size());
}

void ReportError(be::error_code ec, char const* what) {
  if (ec == be::error::timeout) {
    VECRO_LOG(DEBUG) << what << ": " << ec.message();
    return;
  }
  VECRO_LOG(WARNING) << what << ": " << ec.message();
}

Status ListenError(be::error_code ec, char const* what,
                   tcp::endpoint const& endpoint) {
  std::ostringstream os;
  os << endpoint;
  return internal::UnavailableError(
      absl::StrCat(what, ": ", ec.message()),
      VECRO_ERROR_INFO()
          .WithReason("LISTEN_FAILED")
          .WithMetadata("address", os.str()));
}

}  // namespace

StatusOr<ListenAddress> ParseListenAddress(std::string const& address) {
  auto invalid = [&address] {
    return internal::InvalidArgumentError(
        absl::StrCat("invalid listen address <", address, ">"),
        VECRO_ERROR_INFO().WithReason("INVALID_LISTEN_ADDRESS"));
  };
  std::string host;
  absl::string_view port = address;
  if (!address.empty() && address.front() == '[') {
    auto const close = address.find("]:");
    if (close == std::string::npos) return invalid();
    host = address.substr(1, close - 1);
    port = absl::string_view(address).substr(close + 2);
  } else {
    auto const colon = address.rfind(':');
    if (colon != std::string::npos) {
      host = address.substr(0, colon);
      port = absl::string_view(address).substr(colon + 1);
      // IPv6 addresses must be bracketed.
      if (host.find(':') != std::string::npos) return invalid();
    }
  }
  std::uint32_t value;
  if (!absl::SimpleAtoi(port, &value) ||
      value > std::numeric_limits<std::uint16_t>::max()) {
    return invalid();
  }
  return ListenAddress{std::move(host), static_cast<std::uint16_t>(value)};
}

StatusOr<workload::WorkloadRequest> DecodeWorkloadRequest(
    std::string const& body) {
  if (absl::StripAsciiWhitespace(body).empty()) {
    return workload::WorkloadRequest{};
  }
  auto json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    return internal::InvalidArgumentError(
        "request body is not a JSON object",
        VECRO_ERROR_INFO().WithReason("DECODE_FAILED"));
  }
  return workload::WorkloadRequest{body};
}

std::string EncodeWorkloadResponse(workload::WorkloadResponse const& response) {
  nlohmann::json json;
  json["bytes"] = static_cast<std::uint64_t>(response.bytes);
  json["reads"] = response.reads;
  json["writes"] = response.writes;
  json["ok"] = response.ok;
  return json.dump();
}

std::string EncodeError(Status const& status) {
  nlohmann::json error;
  error["code"] = StatusCodeToString(status.code());
  error["message"] = status.message();
  nlohmann::json json;
  json["error"] = std::move(error);
  // Store messages are not guaranteed to be valid UTF-8.
  return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

unsigned HttpStatusFromCode(StatusCode code) {
  switch (code) {
    case StatusCode::kOk:
      return 200;
    case StatusCode::kInvalidArgument:
      return 400;
    case StatusCode::kNotFound:
      return 404;
    case StatusCode::kCancelled:
      return 499;
    case StatusCode::kUnavailable:
      return 503;
    case StatusCode::kDeadlineExceeded:
      return 504;
    default:
      break;
  }
  return 500;
}

HttpHandler::HttpHandler(workload_internal::Endpoint endpoint,
                         workload_internal::ResponseFinalizer finalizer,
                         Options const& opts)
    : endpoint_(std::move(endpoint)),
      finalizer_(std::move(finalizer)),
      request_timeout_(opts.get<workload::RequestTimeoutOption>()),
      metrics_address_(opts.get<workload::MetricsAddressOption>()) {}

HttpHandler::Response HttpHandler::HandleRequest(Request const& request) try {
  return Invoke(request);
} catch (std::exception const& ex) {
  auto status = internal::InternalError(
      absl::StrCat("exception caught in HTTP handler: ", ex.what()),
      VECRO_ERROR_INFO());
  VECRO_LOG(ERROR) << status;
  // The request context is gone, but the failure is still counted.
  workload::CallContext context;
  return Finalize(context, request, HttpStatusFromCode(status.code()),
                  EncodeError(status));
}

HttpHandler::Response HttpHandler::Invoke(Request const& request) {
  auto const target = ToString(request.target());
  if (target.substr(0, target.find('?')) == "/metrics") {
    auto status = internal::NotFoundError(
        absl::StrCat("metrics are served on ", metrics_address_, "/metrics"),
        VECRO_ERROR_INFO().WithReason("METRICS_ADDRESS"));
    return MakeResponse(request, HttpStatusFromCode(status.code()),
                        EncodeError(status));
  }

  workload::CallContext context;
  for (auto const& field : request) {
    context.AddHeader(ToString(field.name_string()), ToString(field.value()));
  }
  context.set_deadline(workload::CallContext::Clock::now() +
                       request_timeout_);

  auto decoded = DecodeWorkloadRequest(request.body());
  if (!decoded) {
    // A client error, not a server fault.
    VECRO_LOG(DEBUG) << "cannot decode request: " << decoded.status();
    return Finalize(context, request,
                    HttpStatusFromCode(decoded.status().code()),
                    EncodeError(decoded.status()));
  }
  auto result = endpoint_(context, absl::any(*std::move(decoded)));
  if (!result) {
    return Finalize(context, request,
                    HttpStatusFromCode(result.status().code()),
                    EncodeError(result.status()));
  }
  auto const* response = absl::any_cast<workload::WorkloadResponse>(&*result);
  if (response == nullptr) {
    auto status =
        internal::InternalError("unexpected response type", VECRO_ERROR_INFO());
    return Finalize(context, request, HttpStatusFromCode(status.code()),
                    EncodeError(status));
  }
  return Finalize(context, request, 200, EncodeWorkloadResponse(*response));
}

HttpHandler::Response HttpHandler::MakeResponse(Request const& request,
                                                unsigned status,
                                                std::string body) const {
  Response res;
  res.version(request.version());
  res.result(status);
  res.set(be::http::field::server, absl::StrCat("vecro/", version_string()));
  res.set(be::http::field::content_type, "application/json");
  res.keep_alive(request.keep_alive());
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

HttpHandler::Response HttpHandler::Finalize(workload::CallContext& context,
                                            Request const& request,
                                            unsigned status,
                                            std::string body) const {
  auto res = MakeResponse(request, status, std::move(body));
  if (finalizer_) {
    finalizer_(context, static_cast<int>(status), res.body().size());
  }
  return res;
}

void HttpSession::Start() {
  parser_.emplace();
  parser_->body_limit(kRequestBodySizeLimit);
  stream_.expires_after(kRequestReadTimeout);

  be::http::async_read(
      stream_, buffer_, *parser_,
      [self = shared_from_this()](be::error_code ec, std::size_t) {
        self->OnRead(ec);
      });
}

void HttpSession::OnRead(be::error_code ec) {
  // The client closed the connection.
  if (ec == be::http::error::end_of_stream) return Close();
  if (ec) return ReportError(ec, "read");

  // Hold the response until the write completes.
  struct PendingResponse {
    PendingResponse(std::shared_ptr<HttpSession> s, HttpHandler::Response r)
        : session(std::move(s)), response(std::move(r)) {}

    std::shared_ptr<HttpSession> session;
    HttpHandler::Response response;
  };
  auto request = parser_->release();
  auto pr = std::make_shared<PendingResponse>(
      shared_from_this(), handler_->HandleRequest(request));
  be::http::async_write(stream_, pr->response,
                        [pr](be::error_code ec, std::size_t) {
                          pr->session->OnWrite(pr->response.need_eof(), ec);
                        });
}

void HttpSession::OnWrite(bool need_eof, be::error_code ec) {
  if (ec) return ReportError(ec, "write");
  if (need_eof) return Close();
  Start();
}

void HttpSession::Close() {
  be::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  if (ec) ReportError(ec, "shutdown");
}

HttpAcceptor::HttpAcceptor(asio::io_context& ioc,
                           std::shared_ptr<HttpHandler> handler)
    : ioc_(ioc),
      socket_acceptor_(asio::make_strand(ioc_)),
      handler_(std::move(handler)) {}

Status HttpAcceptor::Listen(tcp::endpoint const& endpoint) {
  be::error_code ec;
  socket_acceptor_.open(endpoint.protocol(), ec);
  if (ec) return ListenError(ec, "open", endpoint);
  socket_acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
  if (ec) return ListenError(ec, "set_option", endpoint);
  socket_acceptor_.bind(endpoint, ec);
  if (ec) return ListenError(ec, "bind", endpoint);
  socket_acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if (ec) return ListenError(ec, "listen", endpoint);
  return Status{};
}

tcp::endpoint HttpAcceptor::local_endpoint() const {
  be::error_code ec;
  auto endpoint = socket_acceptor_.local_endpoint(ec);
  if (ec) return tcp::endpoint{};
  return endpoint;
}

void HttpAcceptor::Start() {
  socket_acceptor_.async_accept(
      asio::make_strand(ioc_),
      [self = shared_from_this()](be::error_code ec, tcp::socket s) {
        self->OnAccept(ec, std::move(s));
      });
}

void HttpAcceptor::OnAccept(be::error_code ec, tcp::socket socket) {
  if (ec) {
    ReportError(ec, "accept");
  } else {
    std::make_shared<HttpSession>(std::move(socket), handler_)->Start();
  }
  Start();
}

StatusOr<std::shared_ptr<HttpAcceptor>> MakeHttpAcceptor(
    asio::io_context& ioc, ListenAddress const& address,
    std::shared_ptr<HttpHandler> handler) {
  tcp::endpoint endpoint{tcp::v4(), address.port};
  if (!address.host.empty()) {
    be::error_code ec;
    auto ip = asio::ip::make_address(address.host, ec);
    if (!ec) {
      endpoint = tcp::endpoint{ip, address.port};
    } else {
      tcp::resolver resolver(ioc);
      auto results =
          resolver.resolve(address.host, std::to_string(address.port), ec);
      if (ec || results.empty()) {
        return internal::UnavailableError(
            absl::StrCat("cannot resolve <", address.host, ">: ",
                         ec.message()),
            VECRO_ERROR_INFO()
                .WithReason("LISTEN_FAILED")
                .WithMetadata("host", address.host));
      }
      endpoint = results.begin()->endpoint();
    }
  }
  auto acceptor = std::make_shared<HttpAcceptor>(ioc, std::move(handler));
  auto status = acceptor->Listen(endpoint);
  if (!status.ok()) return status;
  return acceptor;
}

VECRO_INLINE_NAMESPACE_END
}  // namespace server
}  // namespace vecro
