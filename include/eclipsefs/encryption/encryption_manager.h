#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "eclipsefs/security/zeroizer.h"

namespace eclipsefs::encryption {

// Stored in block headers as a single byte.
enum class EncryptionType : uint8_t {
  kNone = 0,
  kAes256Gcm = 1,
  kChaCha20Poly1305 = 2,
  kXChaCha20Poly1305 = 3,
};

std::string_view EncryptionTypeName(EncryptionType type) noexcept;

// Accepts "none", "aes-256-gcm" ("aes"), "chacha20-poly1305" ("chacha") and
// "xchacha20-poly1305" ("xchacha").
std::optional<EncryptionType> ParseEncryptionType(std::string_view text);

struct EncryptionConfig {
  EncryptionType algorithm{EncryptionType::kNone};
  std::size_t key_size{0};
  std::size_t iv_size{0};
  std::size_t tag_size{0};
  bool hw_accel{false};

  static EncryptionConfig For(EncryptionType type) noexcept;
  bool operator==(const EncryptionConfig&) const = default;
};

using Clock = std::chrono::system_clock;

struct EncryptionKey {
  uint64_t id{0};
  EncryptionType algorithm{EncryptionType::kNone};
  security::SecretBytes bytes;
  Clock::time_point created_at{};
  std::optional<Clock::time_point> expires_at;
  uint64_t operation_count{0};
  uint32_t rotation_count{0}; // generation: 0 for a fresh key, predecessor + 1 after rotation
};

// Key metadata without the secret bytes.
struct KeyInfo {
  uint64_t id{0};
  EncryptionType algorithm{EncryptionType::kNone};
  Clock::time_point created_at{};
  std::optional<Clock::time_point> expires_at;
  uint64_t operation_count{0};
  uint32_t rotation_count{0};
};

struct EncryptionStats {
  uint64_t total_encrypted{0};
  uint64_t total_decrypted{0};
  uint64_t key_rotations{0};
  uint64_t hardware_accelerations{0};
};

// Per-path AEAD with key lifecycle. Output of Encrypt for a real algorithm is
// IV || ciphertext || tag; the associated data is key_id (LE u64) || algorithm.
class EncryptionManager {
public:
  using TimeSource = std::function<Clock::time_point()>;

  explicit EncryptionManager(EncryptionType default_algorithm = EncryptionType::kAes256Gcm,
                             uint64_t rotation_threshold = 1000,
                             std::chrono::seconds grace_period = std::chrono::seconds{0});
  ~EncryptionManager();

  EncryptionManager(const EncryptionManager&) = delete;
  EncryptionManager& operator=(const EncryptionManager&) = delete;

  // Later registrations of an equal-length prefix never win over earlier ones.
  void AddPolicy(std::string prefix, EncryptionType algorithm);
  [[nodiscard]] EncryptionConfig GetConfigForPath(std::string_view path) const;
  [[nodiscard]] const EncryptionConfig& DefaultConfig() const noexcept { return default_config_; }

  uint64_t GenerateKey(EncryptionType algorithm);
  uint64_t ImportKey(EncryptionType algorithm, std::span<const uint8_t> key_bytes);
  uint64_t RotateKey(uint64_t key_id);
  [[nodiscard]] bool NeedsRotation(uint64_t key_id) const;
  std::size_t CleanupExpiredKeys();

  // Current key for |algorithm|: generated on first use, rotated once it
  // needs rotation.
  uint64_t ActiveKeyFor(EncryptionType algorithm);

  std::vector<uint8_t> Encrypt(std::span<const uint8_t> data, uint64_t key_id, std::string_view path);
  std::vector<uint8_t> Decrypt(std::span<const uint8_t> data, uint64_t key_id, std::string_view path);

  [[nodiscard]] bool HasKey(uint64_t key_id) const;
  [[nodiscard]] std::optional<KeyInfo> DescribeKey(uint64_t key_id) const;
  [[nodiscard]] std::size_t KeyCount() const;
  [[nodiscard]] EncryptionStats Stats() const;

  void SetTimeSourceForTesting(TimeSource source);

private:
  struct Policy {
    std::string prefix;
    EncryptionConfig config;
  };

  uint64_t StoreKeyLocked(EncryptionType algorithm, security::SecretBytes bytes, uint32_t generation);
  EncryptionKey& FindKeyLocked(uint64_t key_id);
  bool NeedsRotationLocked(const EncryptionKey& key) const;
  Clock::time_point NowLocked() const;

  EncryptionConfig default_config_;
  uint64_t rotation_threshold_;
  std::chrono::seconds grace_period_;
  std::vector<Policy> policies_;
  std::map<uint64_t, EncryptionKey> keys_;
  std::map<EncryptionType, uint64_t> active_keys_;
  std::atomic<uint64_t> next_key_id_{1};
  EncryptionStats stats_{};
  bool hardware_aes_{false};
  TimeSource now_;
  mutable std::mutex mutex_;
};

}  // namespace eclipsefs::encryption
