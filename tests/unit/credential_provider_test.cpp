#include "internal/auth/credential_provider.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;
using streamlift::auth::Credentials;
using streamlift::auth::CredentialProvider;
using streamlift::auth::EnsureFresh;
using streamlift::auth::StaticCredentialProvider;
using streamlift::util::Now;

class ScriptedProvider final : public CredentialProvider {
 public:
  Credentials current;
  Credentials next;
  int         refreshes = 0;

  Credentials Current() override {
    return current;
  }

  Credentials Refresh() override {
    ++refreshes;
    current = next;
    return current;
  }
};

void TestNonExpiringCredentialsAreNeverRefreshed() {
  ScriptedProvider provider;
  provider.current.identity_id = "tenant";

  auto creds = EnsureFresh(provider, 5min);
  assert(creds.identity_id == "tenant");
  assert(provider.refreshes == 0);
}

void TestCredentialsInsideMarginAreRefreshed() {
  ScriptedProvider provider;
  provider.current.access_key = "old";
  provider.current.expires_at = Now() + 1min;
  provider.next.access_key    = "new";
  provider.next.expires_at    = Now() + 1h;

  auto creds = EnsureFresh(provider, 5min);
  assert(creds.access_key == "new");
  assert(provider.refreshes == 1);
}

void TestStillExpiringAfterRefreshThrows() {
  ScriptedProvider provider;
  provider.current.expires_at = Now() + 1min;
  provider.next.expires_at    = Now() + 2min;

  bool threw = false;
  try {
    EnsureFresh(provider, 5min);
  } catch (const streamlift::util::CredentialExpired&) {
    threw = true;
  }
  assert(threw);
}

void TestFileOverridesConfigAndIsReloaded() {
  streamlift::testing::TempDir dir("credentials");
  const auto                   file = dir.Path() / "credentials.json";
  streamlift::testing::WriteFile(file, R"({"identityId": "from-file", "accessKeyId": "AK1", "secretAccessKey": "SK1", "expiresAt": 4102444800000})");

  streamlift::runtime::config::CredentialsConfig config;
  config.set_identity_id("from-config");
  config.set_access_key("config-key");
  config.set_credentials_file(file.string());

  StaticCredentialProvider provider(config);
  auto                     creds = provider.Current();
  assert(creds.identity_id == "from-file");
  assert(creds.access_key == "AK1");
  assert(streamlift::util::ToUnixMillis(creds.expires_at) == 4102444800000ull);

  streamlift::testing::WriteFile(file, R"({"identityId": "from-file", "accessKeyId": "AK2", "secretAccessKey": "SK2", "sessionToken": "T"})");
  creds = provider.Refresh();
  assert(creds.access_key == "AK2");
  assert(creds.session_token == "T");
  assert(provider.Current().access_key == "AK2");
}

void TestUnreadableFileIsCredentialFailure() {
  streamlift::testing::TempDir dir("credentials_bad");
  const auto                   file = dir.Path() / "credentials.json";
  streamlift::testing::WriteFile(file, "not json");

  streamlift::runtime::config::CredentialsConfig config;
  config.set_identity_id("tenant");
  config.set_credentials_file(file.string());

  bool threw = false;
  try {
    StaticCredentialProvider provider(config);
  } catch (const streamlift::util::CredentialExpired&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestNonExpiringCredentialsAreNeverRefreshed();
  TestCredentialsInsideMarginAreRefreshed();
  TestStillExpiringAfterRefreshThrows();
  TestFileOverridesConfigAndIsReloaded();
  TestUnreadableFileIsCredentialFailure();

  std::cout << "streamlift_unit_credential_provider: pass\n";
  return 0;
}
