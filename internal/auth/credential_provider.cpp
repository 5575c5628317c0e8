#include "credential_provider.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace streamlift::auth {

using streamlift::observability::StringField;

namespace {

std::string ReadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw util::CredentialExpired("credentials file not readable: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

std::string StringValue(const google::protobuf::Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return {};
  }
  return it->second.string_value();
}

} // namespace

Credentials EnsureFresh(CredentialProvider& provider, std::chrono::milliseconds margin) {
  auto credentials = provider.Current();
  if (!credentials.ExpiresWithin(margin, util::Now())) {
    return credentials;
  }

  STREAMLIFT_LOG_INFO("Refreshing credentials", {StringField("identity_id", credentials.identity_id)});
  credentials = provider.Refresh();
  if (credentials.ExpiresWithin(margin, util::Now())) {
    throw util::CredentialExpired("credentials for " + credentials.identity_id + " expire before the refresh margin");
  }
  return credentials;
}

StaticCredentialProvider::StaticCredentialProvider(streamlift::runtime::config::CredentialsConfig config) : config_(std::move(config)) {
  current_ = Load();
}

Credentials StaticCredentialProvider::Load() const {
  Credentials credentials;
  credentials.identity_id   = config_.identity_id();
  credentials.access_key    = config_.access_key();
  credentials.secret_key    = config_.secret_key();
  credentials.session_token = config_.session_token();
  if (config_.expires_at_unix_ms() > 0) {
    credentials.expires_at = util::FromUnixMillis(config_.expires_at_unix_ms());
  }

  if (config_.credentials_file().empty()) {
    return credentials;
  }

  google::protobuf::Struct object;
  auto status = google::protobuf::util::JsonStringToMessage(ReadFile(config_.credentials_file()), &object);
  if (!status.ok()) {
    throw util::CredentialExpired("invalid credentials file: " + std::string(status.message()));
  }

  if (auto value = StringValue(object, "identityId"); !value.empty()) credentials.identity_id = value;
  if (auto value = StringValue(object, "accessKeyId"); !value.empty()) credentials.access_key = value;
  if (auto value = StringValue(object, "secretAccessKey"); !value.empty()) credentials.secret_key = value;
  credentials.session_token = StringValue(object, "sessionToken");

  auto expires = object.fields().find("expiresAt");
  if (expires != object.fields().end() && expires->second.kind_case() == google::protobuf::Value::kNumberValue) {
    credentials.expires_at = util::FromUnixMillis(static_cast<uint64_t>(expires->second.number_value()));
  }
  return credentials;
}

Credentials StaticCredentialProvider::Current() {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

Credentials StaticCredentialProvider::Refresh() {
  auto loaded = Load();
  std::lock_guard<std::mutex> lock(mutex_);
  current_ = std::move(loaded);
  return current_;
}

} // namespace streamlift::auth
