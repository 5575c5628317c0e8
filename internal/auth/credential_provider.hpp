#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

namespace streamlift::auth {

struct Credentials {
  // Tenant scope (identity id) used in keys and API paths.
  std::string identity_id;
  std::string access_key;
  std::string secret_key;
  std::string session_token;
  // Epoch means "never expires".
  util::TimePoint expires_at{};

  bool ExpiresWithin(std::chrono::milliseconds margin, util::TimePoint now) const {
    return expires_at != util::TimePoint{} && now + margin >= expires_at;
  }
};

/*
  Source of object-store credentials.

  The identity exchange itself lives outside this process; implementations
  only hand out what they currently hold and reload on Refresh().
*/
class CredentialProvider {
 public:
  virtual ~CredentialProvider() = default;

  virtual Credentials Current() = 0;

  // Throws util::CredentialExpired when no usable credentials can be obtained.
  virtual Credentials Refresh() = 0;
};

/*
  Refresh if the current credentials expire within margin. Throws
  util::CredentialExpired when the refreshed credentials are still inside it.
*/
Credentials EnsureFresh(CredentialProvider& provider, std::chrono::milliseconds margin);

/*
  Credentials from config, optionally overridden by a JSON file:

      {"identityId": "...", "accessKeyId": "...", "secretAccessKey": "...",
       "sessionToken": "...", "expiresAt": 1735689600000}

  The file is re-read on every Refresh().
*/
class StaticCredentialProvider final : public CredentialProvider {
 public:
  explicit StaticCredentialProvider(streamlift::runtime::config::CredentialsConfig config);

  Credentials Current() override;
  Credentials Refresh() override;

 private:
  Credentials Load() const;

  streamlift::runtime::config::CredentialsConfig config_;

  std::mutex  mutex_;
  Credentials current_;
};

} // namespace streamlift::auth
