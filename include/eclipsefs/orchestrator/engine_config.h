#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "eclipsefs/encryption/encryption_manager.h"
#include "eclipsefs/storage/compression.h"
#include "eclipsefs/storage/node_cache.h"

namespace eclipsefs::orchestrator {

struct EncryptionPolicy {
  std::string prefix;
  encryption::EncryptionType algorithm{encryption::EncryptionType::kNone};
};

struct EngineConfig {
  storage::CacheStrategy cache_strategy{storage::CacheStrategy::kArc};
  std::size_t cache_capacity{1024};
  storage::CompressionType compression{storage::CompressionType::kNone};
  int zstd_level{3};
  uint64_t rotation_threshold{1000};
  std::chrono::seconds key_grace_period{0};
  bool enable_dedup{true};
  encryption::EncryptionType default_encryption{encryption::EncryptionType::kAes256Gcm};
  std::vector<EncryptionPolicy> policies{DefaultPolicies()};

  static std::vector<EncryptionPolicy> DefaultPolicies();

  // Defaults overlaid with the ECLIPSEFS_* environment variables. A malformed
  // value throws Error{InvalidArgument}.
  static EngineConfig FromEnvironment();

  // Throws Error{InvalidArgument} on out-of-range values.
  void Validate() const;
};

}  // namespace eclipsefs::orchestrator
