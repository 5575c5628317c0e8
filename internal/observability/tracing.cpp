#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <mutex>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/export_target.hpp"

namespace streamlift::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

constexpr const char* kInstrumentation        = "streamlift";
constexpr const char* kInstrumentationVersion = "0.1.0";

std::mutex                                          g_mutex;
std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const ExportTarget& target) {
  if (target.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = target.use_tls;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

// The global provider is a no-op tracer until InitializeTracing installs one.
opentelemetry::nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  std::lock_guard lock(g_mutex);
  if (!g_tracer) {
    g_tracer = trace_api::Provider::GetTracerProvider()->GetTracer(kInstrumentation, kInstrumentationVersion);
  }
  return g_tracer;
}

} // namespace

bool InitializeTracing(const streamlift::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto target   = ResolveExportTarget(observability, Signal::kTraces);
  auto       exporter = MakeExporter(target);

  // Simple export makes spans visible immediately; useful against a local collector.
  std::unique_ptr<sdktrace::SpanProcessor> processor =
      observability.simple_span_processor()
          ? sdktrace::SimpleSpanProcessorFactory::Create(std::move(exporter))
          : sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});

  resource::ResourceAttributes attrs = {{"service.name", target.service_name}};
  std::shared_ptr<sdktrace::TracerProvider> provider =
      sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attrs));

  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(provider));

  std::lock_guard lock(g_mutex);
  g_provider = std::move(provider);
  g_tracer   = g_provider->GetTracer(kInstrumentation, kInstrumentationVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  std::shared_ptr<sdktrace::TracerProvider> provider;
  {
    std::lock_guard lock(g_mutex);
    provider = std::move(g_provider);
    g_tracer = nullptr;
  }
  if (provider) {
    provider->ForceFlush();
    provider->Shutdown();
  }
}

struct TraceSpan::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

TraceSpan::TraceSpan(std::string_view name, std::string_view job_id) : impl_(std::make_unique<Impl>()) {
  auto tracer = CurrentTracer();
  if (!tracer) return;

  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
  if (!job_id.empty()) {
    impl_->span->SetAttribute("streamlift.job_id", std::string(job_id));
  }
}

TraceSpan::~TraceSpan() {
  if (!impl_->span) return;
  impl_->scope.reset();
  impl_->span->End();
}

void TraceSpan::Tag(std::string_view key, std::string_view value) {
  if (impl_->span) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void TraceSpan::Tag(std::string_view key, std::int64_t value) {
  if (impl_->span) impl_->span->SetAttribute(std::string(key), value);
}

void TraceSpan::Fail(std::string_view error) {
  if (!impl_->span) return;
  impl_->span->AddEvent("exception", {{"exception.message", std::string(error)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(error));
}

} // namespace streamlift::observability

#endif
