#include "eclipsefs/orchestrator/engine_config.h"

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string_view>

#include "eclipsefs/error.h"

namespace eclipsefs::orchestrator {

namespace {

using encryption::EncryptionType;

[[noreturn]] void ThrowBadValue(std::string_view name, std::string_view value) {
  throw Error{ErrorDomain::InvalidArgument, errors::argument::kBadConfigValue,
              "Invalid value '" + std::string(value) + "' for " + std::string(name)};
}

std::optional<std::string_view> ReadEnv(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string_view(value);
}

template <typename T>
T ParseNumber(std::string_view name, std::string_view text) {
  T value{};
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    ThrowBadValue(name, text);
  }
  return value;
}

bool ParseBool(std::string_view name, std::string_view text) {
  if (text == "1" || text == "true" || text == "on" || text == "yes") {
    return true;
  }
  if (text == "0" || text == "false" || text == "off" || text == "no") {
    return false;
  }
  ThrowBadValue(name, text);
}

}  // namespace

std::vector<EncryptionPolicy> EngineConfig::DefaultPolicies() {
  return {
      {"/home", EncryptionType::kAes256Gcm},
      {"/etc", EncryptionType::kChaCha20Poly1305},
      {"/var/log", EncryptionType::kAes256Gcm},
      {"/tmp", EncryptionType::kNone},
  };
}

EngineConfig EngineConfig::FromEnvironment() {
  EngineConfig config;
  if (auto value = ReadEnv("ECLIPSEFS_CACHE_STRATEGY")) {
    auto strategy = storage::ParseCacheStrategy(*value);
    if (!strategy) {
      ThrowBadValue("ECLIPSEFS_CACHE_STRATEGY", *value);
    }
    config.cache_strategy = *strategy;
  }
  if (auto value = ReadEnv("ECLIPSEFS_CACHE_CAPACITY")) {
    config.cache_capacity = ParseNumber<std::size_t>("ECLIPSEFS_CACHE_CAPACITY", *value);
  }
  if (auto value = ReadEnv("ECLIPSEFS_COMPRESSION")) {
    auto compression = storage::ParseCompressionType(*value);
    if (!compression) {
      ThrowBadValue("ECLIPSEFS_COMPRESSION", *value);
    }
    config.compression = *compression;
  }
  if (auto value = ReadEnv("ECLIPSEFS_ZSTD_LEVEL")) {
    config.zstd_level = ParseNumber<int>("ECLIPSEFS_ZSTD_LEVEL", *value);
  }
  if (auto value = ReadEnv("ECLIPSEFS_ROTATION_THRESHOLD")) {
    config.rotation_threshold = ParseNumber<uint64_t>("ECLIPSEFS_ROTATION_THRESHOLD", *value);
  }
  if (auto value = ReadEnv("ECLIPSEFS_KEY_GRACE_SECONDS")) {
    config.key_grace_period =
        std::chrono::seconds(ParseNumber<int64_t>("ECLIPSEFS_KEY_GRACE_SECONDS", *value));
  }
  if (auto value = ReadEnv("ECLIPSEFS_DEDUP")) {
    config.enable_dedup = ParseBool("ECLIPSEFS_DEDUP", *value);
  }
  config.Validate();
  return config;
}

void EngineConfig::Validate() const {
  if (cache_capacity == 0) {
    ThrowBadValue("cache_capacity", "0");
  }
  if (rotation_threshold == 0) {
    ThrowBadValue("rotation_threshold", "0");
  }
  if (key_grace_period.count() < 0) {
    ThrowBadValue("key_grace_period", std::to_string(key_grace_period.count()));
  }
  if (zstd_level < 1 || zstd_level > 22) {
    ThrowBadValue("zstd_level", std::to_string(zstd_level));
  }
  for (const auto& policy : policies) {
    if (policy.prefix.empty() || policy.prefix.front() != '/') {
      ThrowBadValue("policy prefix", policy.prefix);
    }
  }
}

}  // namespace eclipsefs::orchestrator
