#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "streamlift_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigParses() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
worker:
  staging_dir: "/tmp/streamlift-staging"
  library_root: "/srv/media"
  max_concurrent_jobs: 4
  concurrent_uploads: 6
  priority_segments: 8
storage:
  root_path: "bucket"
  media_upload_path: "media"
  playlist_upload_path: "playlists"
  filesystem: FILE_SYSTEM_S3
  s3:
    region: "eu-west-1"
api:
  base_url: "https://api.example.com"
  timeout_ms: 5000
credentials:
  identity_id: "tenant-1"
  refresh_margin_ms: 60000
subtitles:
  enabled: true
  api_key: "12345"
queue:
  visibility_timeout_ms: 120000
)");

  auto config = streamlift::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.worker().max_concurrent_jobs() == 4);
  assert(config.storage().filesystem() == streamlift::runtime::config::FILE_SYSTEM_S3);
  assert(config.storage().s3().region() == "eu-west-1");
  assert(config.api().timeout_ms() == 5000);
  assert(config.subtitles().enabled());
  // Quoted scalars stay strings even when they look numeric.
  assert(config.subtitles().api_key() == "12345");

  auto settings = streamlift::config::ResolveWorkerSettings(config);
  assert(settings.staging_dir == "/tmp/streamlift-staging");
  assert(settings.max_concurrent_jobs == 4);
  assert(settings.concurrent_uploads == 6);
  assert(settings.priority_segments == 8);
  assert(settings.visibility_timeout_ms == 120000);
  assert(settings.refresh_margin_ms == 60000);
}

void TestZeroValuesFallBackToDefaults() {
  auto config   = streamlift::config::ConfigLoader::LoadFromYamlString("server:\n  bind_address: \"127.0.0.1:1\"\n");
  auto settings = streamlift::config::ResolveWorkerSettings(config);

  assert(settings.staging_dir == "/tmp/streamlift");
  assert(settings.max_concurrent_jobs == 2);
  assert(settings.concurrent_uploads == 3);
  assert(settings.priority_segments == 5);
  assert(settings.segment_duration_seconds == 10);
  assert(settings.status_interval_ms == 15000);
  assert(settings.shutdown_grace_ms == 30000);
  assert(!settings.keep_staging);
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
)");

  auto config = streamlift::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)streamlift::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

} // namespace

int main() {
  TestFullConfigParses();
  TestZeroValuesFallBackToDefaults();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();

  std::cout << "streamlift_unit_config_loader: pass\n";
  return 0;
}
