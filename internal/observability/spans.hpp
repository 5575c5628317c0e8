#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace streamlift::runtime::config {
class RuntimeConfig;
}

namespace streamlift::observability {

// No-ops returning false unless built with ENABLE_OTEL and enabled in config.
bool InitializeTracing(const streamlift::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const streamlift::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  Active span for the current scope, ended on destruction.

  A non-empty job_id is attached as streamlift.job_id so every span of an
  upload can be found from the job.
*/
class TraceSpan {
 public:
  explicit TraceSpan(std::string_view name, std::string_view job_id = {});
  ~TraceSpan();

  TraceSpan(const TraceSpan&)            = delete;
  TraceSpan& operator=(const TraceSpan&) = delete;

  void Tag(std::string_view key, std::string_view value);
  void Tag(std::string_view key, std::int64_t value);

  // Error status plus an exception event carrying the message.
  void Fail(std::string_view error);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // outcome: "completed" | "failed" | "cancelled"
  void RecordJob(std::string_view outcome, double duration_ms);
  // disposition: "transferred" | "skipped"
  void AddSegments(std::string_view disposition, std::uint64_t count);
  void SetJobsInFlight(std::uint64_t jobs);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const streamlift::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const streamlift::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline TraceSpan::TraceSpan(std::string_view, std::string_view) {
}

inline TraceSpan::~TraceSpan() {
}

inline void TraceSpan::Tag(std::string_view, std::string_view) {
}

inline void TraceSpan::Tag(std::string_view, std::int64_t) {
}

inline void TraceSpan::Fail(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordJob(std::string_view, double) {
}

inline void Metrics::AddSegments(std::string_view, std::uint64_t) {
}

inline void Metrics::SetJobsInFlight(std::uint64_t) {
}
#endif

} // namespace streamlift::observability
