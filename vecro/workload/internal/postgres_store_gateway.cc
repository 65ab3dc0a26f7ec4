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

#include "vecro/workload/internal/postgres_store_gateway.h"
#include "vecro/internal/make_status.h"
#include "vecro/log.h"
#include "vecro/workload/workload_options.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/strip.h"
#include <libpq-fe.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace vecro {
namespace workload_internal {
VECRO_INLINE_NAMESPACE_BEGIN
namespace {

using ::vecro::workload::CallContext;

// How often a blocked query re-checks for cancellation.
auto constexpr kPollSlice = std::chrono::milliseconds(100);

struct PgConnDeleter {
  void operator()(PGconn* conn) const { PQfinish(conn); }
};
using PgConnPtr = std::unique_ptr<PGconn, PgConnDeleter>;

struct PgResultDeleter {
  void operator()(PGresult* result) const { PQclear(result); }
};
using PgResultPtr = std::unique_ptr<PGresult, PgResultDeleter>;

std::string ConnectionError(PGconn* conn) {
  if (conn == nullptr) return "out of memory";
  return std::string(absl::StripTrailingAsciiWhitespace(PQerrorMessage(conn)));
}

Status ConnectError(std::string const& message) {
  return internal::UnavailableError(
      absl::StrCat("cannot connect to the store: ", message),
      VECRO_ERROR_INFO().WithReason("STORE_CONNECT_FAILED"));
}

// Asks the server to abandon the current query, then drains its results.
void CancelQuery(PGconn* conn) {
  PGcancel* cancel = PQgetCancel(conn);
  if (cancel != nullptr) {
    char buffer[256];
    if (PQcancel(cancel, buffer, sizeof(buffer)) == 0) {
      VECRO_LOG(WARNING) << "cannot cancel store query: " << buffer;
    }
    PQfreeCancel(cancel);
  }
  while (PGresult* r = PQgetResult(conn)) PQclear(r);
}

// Waits until the connection socket is readable, for at most one slice or
// the time left before the deadline.
Status WaitReadable(CallContext& context, PGconn* conn) {
  auto timeout = kPollSlice;
  auto remaining = context.remaining();
  if (remaining) timeout = (std::min)(timeout, *remaining);
  pollfd fd{PQsocket(conn), POLLIN, 0};
  auto const r = poll(&fd, 1, static_cast<int>(timeout.count()));
  if (r < 0 && errno != EINTR) {
    return internal::UnavailableError(
        absl::StrCat("poll() failed on store connection, errno=", errno));
  }
  return Status{};
}

/**
 * Sends @p sql with @p params, and waits for its result.
 *
 * The wait is bounded by the call deadline. If the call is cancelled or its
 * deadline expires the query is cancelled on the server.
 */
StatusOr<PgResultPtr> RunQuery(CallContext& context, PGconn* conn,
                               std::string const& sql,
                               std::vector<std::string> const& params) {
  auto status = context.CheckActive();
  if (!status.ok()) return status;

  std::vector<char const*> values;
  values.reserve(params.size());
  for (auto const& p : params) values.push_back(p.c_str());
  if (PQsendQueryParams(conn, sql.c_str(), static_cast<int>(values.size()),
                        nullptr, values.data(), nullptr, nullptr, 0) == 0) {
    return internal::UnavailableError(ConnectionError(conn));
  }

  while (true) {
    if (PQconsumeInput(conn) == 0) {
      return internal::UnavailableError(ConnectionError(conn));
    }
    if (PQisBusy(conn) == 0) break;
    status = context.CheckActive();
    if (status.ok()) status = WaitReadable(context, conn);
    if (!status.ok()) {
      // The connection must be idle before it returns to the pool.
      CancelQuery(conn);
      return status;
    }
  }

  PgResultPtr last;
  while (PGresult* r = PQgetResult(conn)) last.reset(r);
  if (!last) return internal::UnavailableError("store returned no result");
  auto const result_status = PQresultStatus(last.get());
  if (result_status != PGRES_TUPLES_OK && result_status != PGRES_COMMAND_OK) {
    auto const* sql_state = PQresultErrorField(last.get(), PG_DIAG_SQLSTATE);
    return internal::UnavailableError(
        std::string(absl::StripTrailingAsciiWhitespace(
            PQresultErrorMessage(last.get()))),
        VECRO_ERROR_INFO().WithMetadata(
            "sql_state", sql_state == nullptr ? "" : sql_state));
  }
  return last;
}

/// A fixed-size pool of connections, shared by all the calls.
class ConnectionPool {
 public:
  explicit ConnectionPool(std::vector<PgConnPtr> connections) {
    for (auto& c : connections) idle_.push_back(std::move(c));
  }

  /// Waits for an idle connection, at most until the call deadline.
  StatusOr<PgConnPtr> Acquire(CallContext& context) {
    std::unique_lock<std::mutex> lk(mu_);
    while (idle_.empty()) {
      auto status = context.CheckActive();
      if (!status.ok()) return status;
      cv_.wait_for(lk, kPollSlice);
    }
    auto c = std::move(idle_.front());
    idle_.pop_front();
    return c;
  }

  void Release(PgConnPtr conn) {
    if (PQstatus(conn.get()) != CONNECTION_OK) {
      VECRO_LOG(WARNING) << "resetting broken store connection: "
                         << ConnectionError(conn.get());
      PQreset(conn.get());
    }
    {
      std::lock_guard<std::mutex> lk(mu_);
      idle_.push_back(std::move(conn));
    }
    cv_.notify_one();
  }

 private:
  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<PgConnPtr> idle_;
};

class PostgresStoreGateway : public workload::StoreGateway {
 public:
  PostgresStoreGateway(std::vector<PgConnPtr> connections,
                       std::string const& table)
      : pool_(std::move(connections)),
        read_sql_(absl::StrCat("SELECT key, value FROM ", table,
                               " WHERE key >= $1 ORDER BY key LIMIT 1")),
        write_sql_(absl::StrCat("INSERT INTO ", table,
                                " (key, value) VALUES ($1, $2)")) {}

  StatusOr<std::size_t> ReadOne(CallContext& context,
                                std::string const& key) override {
    auto result = Run(context, read_sql_, {key});
    if (!result) return std::move(result).status();
    if (PQntuples(result->get()) == 0) return std::size_t{0};
    return static_cast<std::size_t>(PQgetlength(result->get(), 0, 0)) +
           static_cast<std::size_t>(PQgetlength(result->get(), 0, 1));
  }

  StatusOr<std::size_t> WriteOne(CallContext& context,
                                 workload::StoreItem const& item) override {
    auto result = Run(context, write_sql_, {item.key, item.value});
    if (!result) return std::move(result).status();
    return item.size();
  }

 private:
  StatusOr<PgResultPtr> Run(CallContext& context, std::string const& sql,
                            std::vector<std::string> const& params) {
    auto conn = pool_.Acquire(context);
    if (!conn) return std::move(conn).status();
    auto result = RunQuery(context, conn->get(), sql, params);
    pool_.Release(*std::move(conn));
    return result;
  }

  ConnectionPool pool_;
  std::string read_sql_;
  std::string write_sql_;
};

StatusOr<PgConnPtr> Connect(ConnectionParameters const& parameters) {
  std::vector<char const*> keywords;
  std::vector<char const*> values;
  for (auto const& kv : parameters) {
    keywords.push_back(kv.first.c_str());
    values.push_back(kv.second.c_str());
  }
  keywords.push_back(nullptr);
  values.push_back(nullptr);
  PgConnPtr conn(PQconnectdbParams(keywords.data(), values.data(), 0));
  if (!conn || PQstatus(conn.get()) != CONNECTION_OK) {
    return ConnectError(ConnectionError(conn.get()));
  }
  return conn;
}

}  // namespace

ConnectionParameters MakeConnectionParameters(Options const& opts) {
  using namespace ::vecro::workload;  // NOLINT(google-build-using-namespace)
  ConnectionParameters parameters{
      {"host", opts.get<StoreHostOption>()},
      {"port", std::to_string(opts.get<StorePortOption>())},
      {"dbname", opts.get<StoreDatabaseOption>()},
      {"connect_timeout",
       std::to_string(opts.get<StoreConnectTimeoutOption>().count())},
      {"application_name", opts.get<ServiceNameOption>()},
  };
  if (!opts.get<StoreUserOption>().empty()) {
    parameters.emplace_back("user", opts.get<StoreUserOption>());
  }
  if (!opts.get<StorePasswordOption>().empty()) {
    parameters.emplace_back("password", opts.get<StorePasswordOption>());
  }
  return parameters;
}

std::string QuoteIdentifier(absl::string_view name) {
  return absl::StrCat("\"", absl::StrReplaceAll(name, {{"\"", "\"\""}}),
                      "\"");
}

StatusOr<std::shared_ptr<workload::StoreGateway>> MakePostgresStoreGateway(
    Options const& opts) {
  auto const parameters = MakeConnectionParameters(opts);
  auto const pool_size =
      (std::max)(1, opts.get<workload::StorePoolSizeOption>());
  std::vector<PgConnPtr> connections;
  for (int i = 0; i != pool_size; ++i) {
    auto conn = Connect(parameters);
    if (!conn) return std::move(conn).status();
    connections.push_back(*std::move(conn));
  }

  auto const& collection = opts.get<workload::StoreCollectionOption>();
  auto const table = QuoteIdentifier(collection);
  auto const timeout = opts.get<workload::StoreConnectTimeoutOption>();
  for (auto const& sql : {
           std::string("SELECT 1"),
           absl::StrCat("CREATE TABLE IF NOT EXISTS ", table,
                        " (key TEXT NOT NULL, value TEXT NOT NULL)"),
           absl::StrCat("CREATE INDEX IF NOT EXISTS ",
                        QuoteIdentifier(collection + "_key_idx"), " ON ",
                        table, " (key)"),
       }) {
    CallContext context;
    context.set_deadline(CallContext::Clock::now() + timeout);
    auto result = RunQuery(context, connections.front().get(), sql, {});
    if (!result) return ConnectError(result.status().message());
  }
  VECRO_LOG(INFO) << "connected to the store with " << connections.size()
                  << " connection(s), collection=" << collection;
  return std::shared_ptr<workload::StoreGateway>(
      std::make_shared<PostgresStoreGateway>(std::move(connections), table));
}

VECRO_INLINE_NAMESPACE_END
}  // namespace workload_internal
}  // namespace vecro
