#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace streamlift::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static streamlift::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static streamlift::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

/*
  Effective values: proto3 zero means "not set", so defaults are applied here.
*/
struct WorkerSettings {
  std::string staging_dir;
  std::string library_root;
  uint32_t    max_concurrent_jobs      = 2;
  uint32_t    concurrent_uploads       = 3;
  uint32_t    priority_segments        = 5;
  uint32_t    segment_duration_seconds = 10;
  uint64_t    status_interval_ms       = 15000;
  uint32_t    consumer_threads         = 2;
  uint64_t    shutdown_grace_ms        = 30000;
  uint64_t    visibility_timeout_ms    = 600000;
  uint64_t    refresh_margin_ms        = 300000;
  uint32_t    max_subtitle_candidates  = 5;
  bool        keep_staging             = false;
};

WorkerSettings ResolveWorkerSettings(const streamlift::runtime::config::RuntimeConfig& config);

} // namespace streamlift::config
