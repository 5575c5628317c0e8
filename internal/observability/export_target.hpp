#pragma once

#include <string>
#include <string_view>

namespace streamlift::runtime::config {
class ObservabilityConfig;
}

namespace streamlift::observability {

enum class Signal {
  kTraces,
  kMetrics,
};

/*
  Where one OTLP signal is shipped.

  Endpoint precedence:
    observability.otlp_endpoint
    OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT  (used verbatim)
    OTEL_EXPORTER_OTLP_ENDPOINT
    collector default (localhost:4317 / http://localhost:4318)

  Over HTTP a base endpoint gets the signal path (/v1/traces, /v1/metrics)
  appended. TLS follows the endpoint scheme.
*/
struct ExportTarget {
  std::string endpoint;
  bool        http    = false;
  bool        use_tls = false;
  std::string service_name;
};

ExportTarget ResolveExportTarget(const streamlift::runtime::config::ObservabilityConfig& config, Signal signal);

} // namespace streamlift::observability
