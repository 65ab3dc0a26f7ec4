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

#include "vecro/internal/random.h"
#include "vecro/log.h"
#include "vecro/server/http_transport.h"
#include "vecro/telemetry/metrics_configuration.h"
#include "vecro/telemetry/tracing_configuration.h"
#include "vecro/workload/internal/base_workload_service.h"
#include "vecro/workload/internal/postgres_store_gateway.h"
#include "vecro/workload/internal/tracing_middleware.h"
#include "vecro/workload/internal/workload_endpoint.h"
#include "vecro/workload/internal/workload_metrics_decorator.h"
#include "vecro/workload/internal/workload_option_defaults.h"
#include "vecro/workload/workload_options.h"
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>
#include <algorithm>
#include <csignal>
#include <iostream>
#include <thread>
#include <vector>

namespace {

namespace asio = ::boost::asio;
namespace po = ::boost::program_options;
namespace server = ::vecro::server;
namespace workload = ::vecro::workload;
namespace workload_internal = ::vecro::workload_internal;

}  // namespace

int main(int argc, char* argv[]) try {
  po::options_description desc("Server configuration");
  desc.add_options()
      //
      ("help", "produce help message")
      //
      ("listen-address", po::value<std::string>(),
       "override VECRO_LISTEN_ADDRESS")
      //
      ("threads", po::value<int>(), "override VECRO_THREADS");

  po::variables_map vm;
  po::store(po::parse_command_line(argc, argv, desc), vm);
  po::notify(vm);

  if (vm.count("help")) {
    std::cout << desc << "\n";
    return 0;
  }

  vecro::Options overrides;
  if (vm.count("listen-address")) {
    overrides.set<workload::ListenAddressOption>(
        vm["listen-address"].as<std::string>());
  }
  if (vm.count("threads")) {
    overrides.set<workload::ServerThreadsOption>(
        (std::max)(1, vm["threads"].as<int>()));
  }
  auto const options =
      workload_internal::PopulateWorkloadOptions(std::move(overrides));
  VECRO_LOG(INFO) << "vecro " << vecro::version_string() << " starting with "
                  << workload_internal::DescribeWorkloadOptions(options);

  auto const address = server::ParseListenAddress(
      options.get<workload::ListenAddressOption>());
  if (!address) {
    VECRO_LOG(CRITICAL) << "cannot parse listen address: "
                        << address.status();
    return 1;
  }

  auto tracing = vecro::telemetry::ConfigureTracing(options);
  VECRO_LOG(INFO) << "tracing mode: " << tracing->mode();
  auto metrics = vecro::telemetry::ConfigureMetrics(options);
  auto instruments = workload_internal::MakeWorkloadInstruments(
      metrics->provider(), options.get<workload::ServiceNameOption>(),
      options.get<workload::SubsystemOption>());

  auto gateway = workload_internal::MakePostgresStoreGateway(options);
  if (!gateway) {
    VECRO_LOG(CRITICAL) << "cannot connect to the store: "
                        << gateway.status();
    return 1;
  }

  auto base = std::make_shared<workload_internal::BaseWorkloadService>(
      *std::move(gateway), workload_internal::MakeWorkloadConfig(options),
      vecro::internal::MakeDefaultPRNG());
  auto service = workload_internal::DecorateWorkloadService(std::move(base),
                                                            instruments);
  auto endpoint = workload_internal::MakeTracingMiddleware()(
      workload_internal::MakeWorkloadEndpoint(std::move(service)));
  auto handler = std::make_shared<server::HttpHandler>(
      std::move(endpoint),
      workload_internal::MakeThroughputFinalizer(std::move(instruments)),
      options);

  auto const threads = options.get<workload::ServerThreadsOption>();
  asio::io_context ioc{threads};
  auto acceptor = server::MakeHttpAcceptor(ioc, *address, std::move(handler));
  if (!acceptor) {
    VECRO_LOG(CRITICAL) << "cannot listen: " << acceptor.status();
    return 1;
  }
  (*acceptor)->Start();
  VECRO_LOG(INFO) << "listening on " << (*acceptor)->local_endpoint()
                  << " using " << threads << " threads";

  // Capture SIGINT and SIGTERM to perform a clean shutdown.
  asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&ioc](boost::system::error_code const&, int signal) {
    VECRO_LOG(INFO) << "received signal " << signal << ", shutting down";
    ioc.stop();
  });

  std::vector<std::thread> v(threads - 1);
  std::generate_n(v.begin(), v.size(),
                  [&ioc] { return std::thread([&ioc] { ioc.run(); }); });
  ioc.run();
  for (auto& t : v) t.join();

  return 0;
} catch (std::exception const& ex) {
  std::cerr << "Standard exception caught " << ex.what() << '\n';
  return 1;
}
