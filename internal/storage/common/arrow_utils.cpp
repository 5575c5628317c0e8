#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>

namespace streamlift::storage::common {

namespace {

bool LooksLikeCredentialFailure(const std::string& message) {
  static const char* const kMarkers[] = {"ExpiredToken", "TokenRefreshRequired", "InvalidAccessKeyId", "InvalidToken",
                                         "RequestExpired", "SignatureDoesNotMatch"};
  for (const char* marker : kMarkers) {
    if (message.find(marker) != std::string::npos) return true;
  }
  return false;
}

arrow::fs::S3Options BuildS3Options(const streamlift::runtime::config::S3Options& proto_options, const S3Credentials& credentials) {
  arrow::fs::S3Options options = arrow::fs::S3Options::Defaults();
  if (!credentials.access_key.empty()) {
    options.ConfigureAccessKey(credentials.access_key, credentials.secret_key, credentials.session_token);
  }
  if (!proto_options.region().empty()) options.region = proto_options.region();
  if (!proto_options.endpoint_override().empty()) options.endpoint_override = proto_options.endpoint_override();
  if (!proto_options.scheme().empty()) options.scheme = proto_options.scheme();
  if (proto_options.connect_timeout() > 0) options.connect_timeout = proto_options.connect_timeout();
  if (proto_options.request_timeout() > 0) options.request_timeout = proto_options.request_timeout();
  if (!proto_options.tls_ca_file_path().empty()) options.tls_ca_file_path = proto_options.tls_ca_file_path();
  options.force_virtual_addressing = proto_options.force_virtual_addressing();
  options.background_writes        = proto_options.background_writes();
  options.tls_verify_certificates  = proto_options.tls_verify_certificates() || proto_options.tls_ca_file_path().empty();
  return options;
}

} // namespace

void ThrowArrowError(const arrow::Status& status) {
  const auto message = status.ToString();
  if (LooksLikeCredentialFailure(message)) {
    throw util::CredentialExpired(message);
  }
  throw util::TransientIoError(message);
}

std::shared_ptr<arrow::Buffer> ReadLocalFile(const std::string& path) {
  auto file = Unwrap(arrow::io::ReadableFile::Open(path));
  return ReadAll(file);
}

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const streamlift::runtime::config::StorageConfig& storage_config, const S3Credentials& credentials) {
  std::string resolved_path = storage_config.root_path();

  switch (storage_config.filesystem()) {
    case streamlift::runtime::config::FILE_SYSTEM_LOCAL: {
      auto fs = std::make_shared<arrow::fs::LocalFileSystem>();
      return std::make_pair(std::shared_ptr<arrow::fs::FileSystem>(std::move(fs)), resolved_path);
    }
    case streamlift::runtime::config::FILE_SYSTEM_S3: {
      ARROW_RETURN_NOT_OK(arrow::fs::EnsureS3Initialized());
      auto options = BuildS3Options(storage_config.s3(), credentials);
      // root_path may be "s3://bucket/prefix" or "bucket/prefix"
      const std::string scheme = "s3://";
      if (resolved_path.rfind(scheme, 0) == 0) {
        resolved_path = resolved_path.substr(scheme.size());
      }
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(options));
      return std::make_pair(std::shared_ptr<arrow::fs::FileSystem>(std::move(fs)), resolved_path);
    }
    case streamlift::runtime::config::FILE_SYSTEM_MEMORY:
      return arrow::Status::Invalid("memory filesystem has no Arrow backing");
    case streamlift::runtime::config::FILE_SYSTEM_AUTO:
    default: {
      std::string path_in_fs;
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(resolved_path, &path_in_fs));
      return std::make_pair(std::move(fs), path_in_fs);
    }
  }
}

} // namespace streamlift::storage::common
