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
#include "vecro/testing_util/scoped_log.h"
#include "vecro/testing_util/status_matchers.h"
#include "vecro/workload/workload_options.h"
#include <gmock/gmock.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <thread>

namespace vecro {
namespace server {
VECRO_INLINE_NAMESPACE_BEGIN
namespace {

namespace be = ::boost::beast;
using ::testing::_;
using ::testing::Contains;
using ::testing::Gt;
using ::testing::HasSubstr;
using ::testing::MockFunction;
using ::testing::Return;
using ::vecro::testing_util::StatusIs;
using ::vecro::workload::CallContext;
using ::vecro::workload::WorkloadRequest;
using ::vecro::workload::WorkloadResponse;

using MockEndpoint =
    MockFunction<StatusOr<absl::any>(CallContext&, absl::any const&)>;
using MockFinalizer = MockFunction<void(CallContext&, int, std::size_t)>;

Options TestOptions() {
  return Options{}
      .set<workload::RequestTimeoutOption>(std::chrono::seconds(30))
      .set<workload::MetricsAddressOption>("0.0.0.0:9464");
}

HttpHandler::Request MakeRequest(std::string target, std::string body) {
  HttpHandler::Request request{be::http::verb::post, target, 11};
  request.set(be::http::field::host, "localhost");
  request.body() = std::move(body);
  request.prepare_payload();
  return request;
}

nlohmann::json ParseBody(HttpHandler::Response const& response) {
  return nlohmann::json::parse(response.body());
}

TEST(ParseListenAddress, HostAndPort) {
  auto address = ParseListenAddress("127.0.0.1:8080");
  ASSERT_STATUS_OK(address);
  EXPECT_EQ(address->host, "127.0.0.1");
  EXPECT_EQ(address->port, 8080);

  address = ParseListenAddress("localhost:0");
  ASSERT_STATUS_OK(address);
  EXPECT_EQ(address->host, "localhost");
  EXPECT_EQ(address->port, 0);
}

TEST(ParseListenAddress, PortOnly) {
  auto address = ParseListenAddress(":8080");
  ASSERT_STATUS_OK(address);
  EXPECT_EQ(address->host, "");
  EXPECT_EQ(address->port, 8080);

  address = ParseListenAddress("9000");
  ASSERT_STATUS_OK(address);
  EXPECT_EQ(address->host, "");
  EXPECT_EQ(address->port, 9000);
}

TEST(ParseListenAddress, Ipv6) {
  auto address = ParseListenAddress("[::1]:8080");
  ASSERT_STATUS_OK(address);
  EXPECT_EQ(address->host, "::1");
  EXPECT_EQ(address->port, 8080);
}

TEST(ParseListenAddress, Invalid) {
  for (std::string const input :
       {"", "localhost", "localhost:", ":http", ":65536", "::1:80", "[::1]",
        "host:-1"}) {
    SCOPED_TRACE("Testing with " + input);
    auto address = ParseListenAddress(input);
    EXPECT_THAT(address, StatusIs(StatusCode::kInvalidArgument));
    EXPECT_EQ(address.status().error_info().reason(),
              "INVALID_LISTEN_ADDRESS");
  }
}

TEST(DecodeWorkloadRequest, AcceptsEmptyAndObjects) {
  auto request = DecodeWorkloadRequest("");
  ASSERT_STATUS_OK(request);
  EXPECT_EQ(request->payload, "");

  request = DecodeWorkloadRequest("  \n");
  ASSERT_STATUS_OK(request);

  request = DecodeWorkloadRequest(R"js({"user": "alice"})js");
  ASSERT_STATUS_OK(request);
  EXPECT_EQ(request->payload, R"js({"user": "alice"})js");
}

TEST(DecodeWorkloadRequest, RejectsOtherBodies) {
  for (std::string const input : {"[1, 2]", "42", "\"text\"", "not json",
                                  "{\"unterminated\": "}) {
    SCOPED_TRACE("Testing with " + input);
    auto request = DecodeWorkloadRequest(input);
    EXPECT_THAT(request, StatusIs(StatusCode::kInvalidArgument));
    EXPECT_EQ(request.status().error_info().reason(), "DECODE_FAILED");
  }
}

TEST(EncodeWorkloadResponse, Fields) {
  auto const json = nlohmann::json::parse(
      EncodeWorkloadResponse(WorkloadResponse{50, 3, 2, true}));
  EXPECT_EQ(json.size(), 4U);
  EXPECT_EQ(json.value("bytes", 0), 50);
  EXPECT_EQ(json.value("reads", 0), 3);
  EXPECT_EQ(json.value("writes", 0), 2);
  EXPECT_EQ(json.value("ok", false), true);
}

TEST(EncodeError, Fields) {
  auto const json = nlohmann::json::parse(
      EncodeError(internal::UnavailableError("store is down")));
  ASSERT_TRUE(json.contains("error"));
  EXPECT_EQ(json["error"].value("code", ""), "UNAVAILABLE");
  EXPECT_EQ(json["error"].value("message", ""), "store is down");
}

TEST(HttpStatusFromCode, Mapping) {
  EXPECT_EQ(HttpStatusFromCode(StatusCode::kOk), 200U);
  EXPECT_EQ(HttpStatusFromCode(StatusCode::kInvalidArgument), 400U);
  EXPECT_EQ(HttpStatusFromCode(StatusCode::kNotFound), 404U);
  EXPECT_EQ(HttpStatusFromCode(StatusCode::kCancelled), 499U);
  EXPECT_EQ(HttpStatusFromCode(StatusCode::kUnavailable), 503U);
  EXPECT_EQ(HttpStatusFromCode(StatusCode::kDeadlineExceeded), 504U);
  EXPECT_EQ(HttpStatusFromCode(StatusCode::kInternal), 500U);
  EXPECT_EQ(HttpStatusFromCode(StatusCode::kUnknown), 500U);
  EXPECT_EQ(HttpStatusFromCode(StatusCode::kPermissionDenied), 500U);
}

TEST(HttpHandler, Success) {
  MockEndpoint endpoint;
  EXPECT_CALL(endpoint, Call)
      .WillOnce([](CallContext&, absl::any const& request) {
        auto const* r = absl::any_cast<WorkloadRequest>(&request);
        EXPECT_NE(r, nullptr);
        return StatusOr<absl::any>(
            absl::any(WorkloadResponse{50, 3, 2, true}));
      });
  MockFinalizer finalizer;
  std::size_t finalized_size = 0;
  EXPECT_CALL(finalizer, Call(_, 200, _))
      .WillOnce([&](CallContext&, int, std::size_t size) {
        finalized_size = size;
      });

  HttpHandler handler(endpoint.AsStdFunction(), finalizer.AsStdFunction(),
                      TestOptions());
  auto response = handler.HandleRequest(MakeRequest("/", "{}"));
  EXPECT_EQ(response.result_int(), 200U);
  EXPECT_EQ(response[be::http::field::content_type], "application/json");
  EXPECT_EQ(finalized_size, response.body().size());
  auto const json = ParseBody(response);
  EXPECT_EQ(json.value("bytes", 0), 50);
  EXPECT_EQ(json.value("ok", false), true);
}

TEST(HttpHandler, CallContextFromRequest) {
  MockEndpoint endpoint;
  EXPECT_CALL(endpoint, Call)
      .WillOnce([](CallContext& context, absl::any const&) {
        EXPECT_EQ(context.GetHeader("TraceParent").value_or(""),
                  "00-0af7651916cd43dd8448eb211c80319c-b7ad6b7169203331-01");
        auto remaining = context.remaining();
        EXPECT_TRUE(remaining.has_value());
        EXPECT_GT(remaining.value_or(std::chrono::milliseconds(0)),
                  std::chrono::milliseconds(0));
        EXPECT_LE(remaining.value_or(std::chrono::milliseconds(0)),
                  std::chrono::milliseconds(std::chrono::seconds(30)));
        return StatusOr<absl::any>(absl::any(WorkloadResponse{0, 0, 0, true}));
      });

  HttpHandler handler(endpoint.AsStdFunction(), nullptr, TestOptions());
  auto request = MakeRequest("/any/path", "");
  request.set("traceparent",
              "00-0af7651916cd43dd8448eb211c80319c-b7ad6b7169203331-01");
  auto response = handler.HandleRequest(request);
  EXPECT_EQ(response.result_int(), 200U);
}

TEST(HttpHandler, DecodeError) {
  testing_util::ScopedLog log;
  MockEndpoint endpoint;
  EXPECT_CALL(endpoint, Call).Times(0);
  MockFinalizer finalizer;
  EXPECT_CALL(finalizer, Call(_, 400, _)).Times(1);

  HttpHandler handler(endpoint.AsStdFunction(), finalizer.AsStdFunction(),
                      TestOptions());
  auto response = handler.HandleRequest(MakeRequest("/", "[1, 2, 3]"));
  EXPECT_EQ(response.result_int(), 400U);
  auto const json = ParseBody(response);
  EXPECT_EQ(json["error"].value("code", ""), "INVALID_ARGUMENT");
  EXPECT_THAT(log.ExtractLines(),
              Contains(HasSubstr("cannot decode request")));
}

TEST(HttpHandler, ErrorMapping) {
  struct TestCase {
    Status status;
    unsigned expected;
  } cases[] = {
      {internal::UnavailableError("store down"), 503},
      {internal::DeadlineExceededError("too slow"), 504},
      {internal::CancelledError("client left"), 499},
      {internal::InternalError("oops"), 500},
  };
  for (auto const& tc : cases) {
    SCOPED_TRACE("Testing with " + tc.status.message());
    MockEndpoint endpoint;
    EXPECT_CALL(endpoint, Call).WillOnce(Return(tc.status));
    MockFinalizer finalizer;
    EXPECT_CALL(finalizer, Call(_, static_cast<int>(tc.expected), _))
        .Times(1);

    HttpHandler handler(endpoint.AsStdFunction(), finalizer.AsStdFunction(),
                        TestOptions());
    auto response = handler.HandleRequest(MakeRequest("/", ""));
    EXPECT_EQ(response.result_int(), tc.expected);
    auto const json = ParseBody(response);
    EXPECT_EQ(json["error"].value("code", ""),
              StatusCodeToString(tc.status.code()));
    EXPECT_EQ(json["error"].value("message", ""), tc.status.message());
  }
}

TEST(HttpHandler, UnexpectedResponseType) {
  MockEndpoint endpoint;
  EXPECT_CALL(endpoint, Call)
      .WillOnce(Return(StatusOr<absl::any>(absl::any(42))));

  HttpHandler handler(endpoint.AsStdFunction(), nullptr, TestOptions());
  auto response = handler.HandleRequest(MakeRequest("/", ""));
  EXPECT_EQ(response.result_int(), 500U);
}

TEST(HttpHandler, MetricsPathNotServed) {
  MockEndpoint endpoint;
  EXPECT_CALL(endpoint, Call).Times(0);
  MockFinalizer finalizer;
  EXPECT_CALL(finalizer, Call).Times(0);

  HttpHandler handler(endpoint.AsStdFunction(), finalizer.AsStdFunction(),
                      TestOptions());
  auto request = MakeRequest("/metrics?format=text", "");
  request.method(be::http::verb::get);
  auto response = handler.HandleRequest(request);
  EXPECT_EQ(response.result_int(), 404U);
  auto const json = ParseBody(response);
  EXPECT_THAT(json["error"].value("message", ""),
              HasSubstr("0.0.0.0:9464/metrics"));
}

TEST(HttpHandler, ExceptionInEndpoint) {
  testing_util::ScopedLog log;
  MockEndpoint endpoint;
  EXPECT_CALL(endpoint, Call)
      .WillOnce([](CallContext&, absl::any const&) -> StatusOr<absl::any> {
        throw std::runtime_error("uh-oh");
      });

  MockFinalizer finalizer;
  EXPECT_CALL(finalizer, Call(_, 500, Gt(0U))).Times(1);

  HttpHandler handler(endpoint.AsStdFunction(), finalizer.AsStdFunction(),
                      TestOptions());
  auto response = handler.HandleRequest(MakeRequest("/", ""));
  EXPECT_EQ(response.result_int(), 500U);
  EXPECT_THAT(log.ExtractLines(), Contains(HasSubstr("uh-oh")));
}

TEST(HttpHandler, KeepAlive) {
  MockEndpoint endpoint;
  EXPECT_CALL(endpoint, Call)
      .Times(2)
      .WillRepeatedly(Return(
          StatusOr<absl::any>(absl::any(WorkloadResponse{0, 0, 0, true}))));

  HttpHandler handler(endpoint.AsStdFunction(), nullptr, TestOptions());
  auto request = MakeRequest("/", "");
  request.keep_alive(true);
  EXPECT_TRUE(handler.HandleRequest(request).keep_alive());
  request.keep_alive(false);
  EXPECT_FALSE(handler.HandleRequest(request).keep_alive());
}

TEST(HttpAcceptor, ServesRequests) {
  MockEndpoint endpoint;
  EXPECT_CALL(endpoint, Call)
      .Times(2)
      .WillRepeatedly(Return(
          StatusOr<absl::any>(absl::any(WorkloadResponse{20, 1, 1, true}))));

  boost::asio::io_context ioc;
  auto handler = std::make_shared<HttpHandler>(endpoint.AsStdFunction(),
                                               nullptr, TestOptions());
  auto acceptor = MakeHttpAcceptor(ioc, ListenAddress{"127.0.0.1", 0},
                                   std::move(handler));
  ASSERT_STATUS_OK(acceptor);
  (*acceptor)->Start();
  std::thread server([&ioc] { ioc.run(); });

  boost::asio::io_context client_ioc;
  boost::asio::ip::tcp::socket socket(client_ioc);
  socket.connect((*acceptor)->local_endpoint());
  be::flat_buffer buffer;
  // Two requests over the same connection.
  for (int i = 0; i != 2; ++i) {
    auto request = MakeRequest("/", "{}");
    request.keep_alive(true);
    be::http::write(socket, request);
    HttpHandler::Response response;
    be::http::read(socket, buffer, response);
    EXPECT_EQ(response.result_int(), 200U);
    EXPECT_EQ(ParseBody(response).value("bytes", 0), 20);
  }
  be::error_code ec;
  socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  socket.close(ec);

  ioc.stop();
  server.join();
}

TEST(HttpAcceptor, ListenFailure) {
  boost::asio::io_context ioc;
  auto first = MakeHttpAcceptor(ioc, ListenAddress{"127.0.0.1", 0}, nullptr);
  ASSERT_STATUS_OK(first);
  auto const port = (*first)->local_endpoint().port();

  // The first acceptor is listening, a second bind fails.
  auto second =
      MakeHttpAcceptor(ioc, ListenAddress{"127.0.0.1", port}, nullptr);
  EXPECT_THAT(second, StatusIs(StatusCode::kUnavailable));
  EXPECT_EQ(second.status().error_info().reason(), "LISTEN_FAILED");
}

}  // namespace
VECRO_INLINE_NAMESPACE_END
}  // namespace server
}  // namespace vecro
