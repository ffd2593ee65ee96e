#include "eclipsefs/orchestrator/engine_config.h"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

#include "eclipsefs/error.h"

namespace {

namespace orchestrator = eclipsefs::orchestrator;
using eclipsefs::encryption::EncryptionType;

constexpr const char* kVariables[] = {
    "ECLIPSEFS_CACHE_STRATEGY",     "ECLIPSEFS_CACHE_CAPACITY",     "ECLIPSEFS_COMPRESSION", "ECLIPSEFS_ZSTD_LEVEL",
    "ECLIPSEFS_ROTATION_THRESHOLD", "ECLIPSEFS_KEY_GRACE_SECONDS", "ECLIPSEFS_DEDUP",
};

void ClearEnvironment() {
  for (const char* name : kVariables) {
    ::unsetenv(name);
  }
}

bool RejectsEnvironment(const char* name, const char* value) {
  ClearEnvironment();
  ::setenv(name, value, 1);
  bool rejected = false;
  try {
    (void)orchestrator::EngineConfig::FromEnvironment();
  } catch (const eclipsefs::Error& err) {
    rejected = err.domain == eclipsefs::ErrorDomain::InvalidArgument &&
               err.code == eclipsefs::errors::argument::kBadConfigValue;
  }
  ClearEnvironment();
  return rejected;
}

bool RejectsConfig(const orchestrator::EngineConfig& config) {
  try {
    config.Validate();
  } catch (const eclipsefs::Error& err) {
    return err.code == eclipsefs::errors::argument::kBadConfigValue;
  }
  return false;
}

void TestDefaults() {
  ClearEnvironment();
  const auto config = orchestrator::EngineConfig::FromEnvironment();
  assert(config.cache_strategy == eclipsefs::storage::CacheStrategy::kArc);
  assert(config.cache_capacity == 1024);
  assert(config.compression == eclipsefs::storage::CompressionType::kNone);
  assert(config.zstd_level == 3 && config.rotation_threshold == 1000);
  assert(config.key_grace_period.count() == 0 && config.enable_dedup);
  assert(config.default_encryption == EncryptionType::kAes256Gcm);

  const auto& policies = config.policies;
  assert(policies.size() == 4);
  assert(policies[0].prefix == "/home" && policies[0].algorithm == EncryptionType::kAes256Gcm);
  assert(policies[1].prefix == "/etc" && policies[1].algorithm == EncryptionType::kChaCha20Poly1305);
  assert(policies[2].prefix == "/var/log" && policies[2].algorithm == EncryptionType::kAes256Gcm);
  assert(policies[3].prefix == "/tmp" && policies[3].algorithm == EncryptionType::kNone);
}

void TestEnvironmentOverlay() {
  ClearEnvironment();
  ::setenv("ECLIPSEFS_CACHE_STRATEGY", "lru", 1);
  ::setenv("ECLIPSEFS_CACHE_CAPACITY", "64", 1);
  ::setenv("ECLIPSEFS_COMPRESSION", "zstd", 1);
  ::setenv("ECLIPSEFS_ZSTD_LEVEL", "9", 1);
  ::setenv("ECLIPSEFS_ROTATION_THRESHOLD", "50", 1);
  ::setenv("ECLIPSEFS_KEY_GRACE_SECONDS", "30", 1);
  ::setenv("ECLIPSEFS_DEDUP", "off", 1);
  const auto config = orchestrator::EngineConfig::FromEnvironment();
  assert(config.cache_strategy == eclipsefs::storage::CacheStrategy::kLru);
  assert(config.cache_capacity == 64);
  assert(config.compression == eclipsefs::storage::CompressionType::kZstd);
  assert(config.zstd_level == 9 && config.rotation_threshold == 50);
  assert(config.key_grace_period == std::chrono::seconds{30});
  assert(!config.enable_dedup);

  ::setenv("ECLIPSEFS_DEDUP", "yes", 1);
  ::setenv("ECLIPSEFS_CACHE_STRATEGY", "", 1);
  const auto again = orchestrator::EngineConfig::FromEnvironment();
  assert(again.enable_dedup);
  assert(again.cache_strategy == eclipsefs::storage::CacheStrategy::kArc && "empty values keep the default");
  ClearEnvironment();
}

void TestMalformedEnvironment() {
  assert(RejectsEnvironment("ECLIPSEFS_CACHE_STRATEGY", "mru"));
  assert(RejectsEnvironment("ECLIPSEFS_CACHE_CAPACITY", "12k"));
  assert(RejectsEnvironment("ECLIPSEFS_CACHE_CAPACITY", "-5"));
  assert(RejectsEnvironment("ECLIPSEFS_CACHE_CAPACITY", "0") && "zero capacity fails validation");
  assert(RejectsEnvironment("ECLIPSEFS_COMPRESSION", "lz4"));
  assert(RejectsEnvironment("ECLIPSEFS_ZSTD_LEVEL", "23"));
  assert(RejectsEnvironment("ECLIPSEFS_ROTATION_THRESHOLD", "0"));
  assert(RejectsEnvironment("ECLIPSEFS_KEY_GRACE_SECONDS", "-1"));
  assert(RejectsEnvironment("ECLIPSEFS_DEDUP", "maybe"));
}

void TestValidate() {
  orchestrator::EngineConfig config;
  config.Validate();

  auto bad_prefix = config;
  bad_prefix.policies.push_back({"relative/path", EncryptionType::kNone});
  assert(RejectsConfig(bad_prefix));

  auto empty_prefix = config;
  empty_prefix.policies.push_back({"", EncryptionType::kNone});
  assert(RejectsConfig(empty_prefix));

  auto no_policies = config;
  no_policies.policies.clear();
  no_policies.Validate();

  auto level = config;
  level.zstd_level = 0;
  assert(RejectsConfig(level));
}

}  // namespace

int main() {
  TestDefaults();
  TestEnvironmentOverlay();
  TestMalformedEnvironment();
  TestValidate();
  std::cout << "config tests ok\n";
  return 0;
}
