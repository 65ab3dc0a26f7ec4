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

#include "vecro/telemetry/tracing_configuration.h"
#include "vecro/log.h"
#include "vecro/workload/workload_options.h"
#include "absl/strings/match.h"
#include <opentelemetry/context/propagation/global_propagator.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/trace_id_ratio_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/propagation/http_trace_context.h>
#include <opentelemetry/trace/provider.h>
#include <chrono>
#include <exception>
#include <memory>
#include <ostream>
#include <string>

namespace vecro {
namespace telemetry {
VECRO_INLINE_NAMESPACE_BEGIN
namespace {

class TracelessConfiguration : public TracingConfiguration {
 public:
  TracingMode mode() const override { return TracingMode::kTraceless; }
};

class ExportTracingConfiguration : public TracingConfiguration {
 public:
  explicit ExportTracingConfiguration(
      std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> provider)
      : provider_(std::move(provider)),
        previous_(opentelemetry::trace::Provider::GetTracerProvider()) {
    opentelemetry::trace::Provider::SetTracerProvider(
        opentelemetry::nostd::shared_ptr<opentelemetry::trace::TracerProvider>(
            provider_));
  }

  ~ExportTracingConfiguration() override {
    if (!provider_->ForceFlush(std::chrono::seconds(5))) {
      VECRO_LOG(WARNING) << "some spans were not exported before shutdown";
    }
    // Reset the global tracer provider.
    opentelemetry::trace::Provider::SetTracerProvider(std::move(previous_));
  }

  TracingMode mode() const override { return TracingMode::kExport; }

 private:
  std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> provider_;
  opentelemetry::nostd::shared_ptr<opentelemetry::trace::TracerProvider>
      previous_;
};

std::unique_ptr<opentelemetry::sdk::trace::SpanExporter> MakeExporter(
    std::string const& endpoint) {
  if (!absl::StartsWith(endpoint, "http://") &&
      !absl::StartsWith(endpoint, "https://")) {
    VECRO_LOG(WARNING) << "trace endpoint <" << endpoint
                       << "> is not an http(s) URL";
    return nullptr;
  }
  opentelemetry::exporter::otlp::OtlpHttpExporterOptions options;
  options.url = endpoint;
  try {
    return opentelemetry::exporter::otlp::OtlpHttpExporterFactory::Create(
        options);
  } catch (std::exception const& ex) {
    VECRO_LOG(WARNING) << "cannot create trace exporter: " << ex.what();
  }
  return nullptr;
}

}  // namespace

std::ostream& operator<<(std::ostream& os, TracingMode mode) {
  switch (mode) {
    case TracingMode::kExport:
      return os << "export";
    case TracingMode::kTraceless:
      return os << "traceless";
  }
  return os << "unknown";
}

std::unique_ptr<TracingConfiguration> ConfigureTracing(Options const& opts) {
  namespace propagation = ::opentelemetry::context::propagation;
  propagation::GlobalTextMapPropagator::SetGlobalPropagator(
      opentelemetry::nostd::shared_ptr<propagation::TextMapPropagator>(
          new opentelemetry::trace::propagation::HttpTraceContext()));

  auto const& endpoint = opts.get<workload::TraceEndpointOption>();
  if (endpoint.empty()) {
    VECRO_LOG(WARNING) << "no trace endpoint configured, running traceless";
    return std::make_unique<TracelessConfiguration>();
  }
  auto exporter = MakeExporter(endpoint);
  if (!exporter) {
    VECRO_LOG(WARNING) << "running traceless";
    return std::make_unique<TracelessConfiguration>();
  }

  auto const& service_name = opts.get<workload::TraceServiceNameOption>();
  auto resource = opentelemetry::sdk::resource::Resource::Create(
      {{"service.name", opentelemetry::nostd::string_view{service_name}}});
  auto processor =
      std::make_unique<opentelemetry::sdk::trace::BatchSpanProcessor>(
          std::move(exporter),
          opentelemetry::sdk::trace::BatchSpanProcessorOptions{});
  auto provider = std::make_shared<opentelemetry::sdk::trace::TracerProvider>(
      std::move(processor), resource,
      opentelemetry::sdk::trace::TraceIdRatioBasedSamplerFactory::Create(
          opts.get<workload::TraceSamplingRatioOption>()));
  VECRO_LOG(INFO) << "exporting traces to " << endpoint;
  return std::make_unique<ExportTracingConfiguration>(std::move(provider));
}

VECRO_INLINE_NAMESPACE_END
}  // namespace telemetry
}  // namespace vecro
