#include "export_target.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace streamlift::observability {

namespace {

constexpr std::string_view kDefaultServiceName = "streamlift-worker";

std::string EnvOrEmpty(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

bool EndsWith(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string WithSignalPath(std::string base, std::string_view path) {
  if (EndsWith(base, path)) return base;
  while (!base.empty() && base.back() == '/') base.pop_back();
  return base + std::string(path);
}

} // namespace

ExportTarget ResolveExportTarget(const streamlift::runtime::config::ObservabilityConfig& config, Signal signal) {
  ExportTarget target;
  target.http = config.transport() == streamlift::runtime::config::OTLP_TRANSPORT_HTTP;

  const std::string_view signal_path = signal == Signal::kTraces ? "/v1/traces" : "/v1/metrics";
  const char*            signal_env  = signal == Signal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";

  if (!config.otlp_endpoint().empty()) {
    target.endpoint = target.http ? WithSignalPath(config.otlp_endpoint(), signal_path) : config.otlp_endpoint();
  } else if (auto specific = EnvOrEmpty(signal_env); !specific.empty()) {
    target.endpoint = specific;
  } else if (auto shared = EnvOrEmpty("OTEL_EXPORTER_OTLP_ENDPOINT"); !shared.empty()) {
    target.endpoint = target.http ? WithSignalPath(shared, signal_path) : shared;
  } else {
    target.endpoint = target.http ? WithSignalPath("http://localhost:4318", signal_path) : "localhost:4317";
  }

  target.use_tls = target.endpoint.rfind("https://", 0) == 0;

  if (!config.service_name().empty()) {
    target.service_name = config.service_name();
  } else if (auto from_env = EnvOrEmpty("OTEL_SERVICE_NAME"); !from_env.empty()) {
    target.service_name = from_env;
  } else {
    target.service_name = std::string(kDefaultServiceName);
  }
  return target;
}

} // namespace streamlift::observability
