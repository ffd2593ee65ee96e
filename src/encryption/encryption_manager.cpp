#include "eclipsefs/encryption/encryption_manager.h"

#include <algorithm>
#include <string>

#include "eclipsefs/common.h"
#include "eclipsefs/crypto/aead.h"
#include "eclipsefs/crypto/provider.h"
#include "eclipsefs/crypto/random.h"
#include "eclipsefs/error.h"
#include "eclipsefs/errors.h"
#include "eclipsefs/orchestrator/event_bus.h"

namespace eclipsefs::encryption {

namespace {

crypto::AeadAlgorithm ToAead(EncryptionType type) {
  switch (type) {
    case EncryptionType::kAes256Gcm:
      return crypto::AeadAlgorithm::kAes256Gcm;
    case EncryptionType::kChaCha20Poly1305:
      return crypto::AeadAlgorithm::kChaCha20Poly1305;
    case EncryptionType::kXChaCha20Poly1305:
      return crypto::AeadAlgorithm::kXChaCha20Poly1305;
    case EncryptionType::kNone:
      break;
  }
  throw Error{ErrorDomain::InvalidArgument, errors::argument::kNoCipherForAlgorithm, "No AEAD for encryption type none"};
}

std::array<uint8_t, 9> BuildAad(uint64_t key_id, EncryptionType algorithm) {
  std::array<uint8_t, 9> aad{};
  StoreLE64(aad, 0, key_id);
  aad[8] = static_cast<uint8_t>(algorithm);
  return aad;
}

void PublishKeyEvent(const char* id, std::string message, uint64_t key_id, EncryptionType algorithm) {
  orchestrator::PublishEvent(
      orchestrator::EventCategory::kSecurity, orchestrator::EventSeverity::kInfo, id, std::move(message),
      {orchestrator::EventField("key_id", std::to_string(key_id), orchestrator::FieldPrivacy::kPublic, true),
       orchestrator::EventField("algorithm", std::string(EncryptionTypeName(algorithm)))});
}

}  // namespace

std::string_view EncryptionTypeName(EncryptionType type) noexcept {
  switch (type) {
    case EncryptionType::kNone:
      return "none";
    case EncryptionType::kAes256Gcm:
      return "aes-256-gcm";
    case EncryptionType::kChaCha20Poly1305:
      return "chacha20-poly1305";
    case EncryptionType::kXChaCha20Poly1305:
      return "xchacha20-poly1305";
  }
  return "unknown";
}

std::optional<EncryptionType> ParseEncryptionType(std::string_view text) {
  if (text == "none") {
    return EncryptionType::kNone;
  }
  if (text == "aes-256-gcm" || text == "aes") {
    return EncryptionType::kAes256Gcm;
  }
  if (text == "chacha20-poly1305" || text == "chacha") {
    return EncryptionType::kChaCha20Poly1305;
  }
  if (text == "xchacha20-poly1305" || text == "xchacha") {
    return EncryptionType::kXChaCha20Poly1305;
  }
  return std::nullopt;
}

EncryptionConfig EncryptionConfig::For(EncryptionType type) noexcept {
  switch (type) {
    case EncryptionType::kNone:
      return {EncryptionType::kNone, 0, 0, 0, false};
    case EncryptionType::kAes256Gcm:
      return {type, 32, 12, 16, true};
    case EncryptionType::kChaCha20Poly1305:
      return {type, 32, 12, 16, false};
    case EncryptionType::kXChaCha20Poly1305:
      return {type, 32, 24, 16, false};
  }
  return {};
}

EncryptionManager::EncryptionManager(EncryptionType default_algorithm, uint64_t rotation_threshold,
                                     std::chrono::seconds grace_period)
    : default_config_(EncryptionConfig::For(default_algorithm)),
      rotation_threshold_(rotation_threshold),
      grace_period_(grace_period),
      hardware_aes_(crypto::HardwareAesAvailable()),
      now_([] { return Clock::now(); }) {}

EncryptionManager::~EncryptionManager() = default;

void EncryptionManager::AddPolicy(std::string prefix, EncryptionType algorithm) {
  std::lock_guard<std::mutex> lock(mutex_);
  policies_.push_back(Policy{std::move(prefix), EncryptionConfig::For(algorithm)});
}

EncryptionConfig EncryptionManager::GetConfigForPath(std::string_view path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const Policy* best = nullptr;
  for (const auto& policy : policies_) {
    if (!path.starts_with(policy.prefix)) {
      continue;
    }
    if (best == nullptr || policy.prefix.size() > best->prefix.size()) {
      best = &policy;
    }
  }
  return best != nullptr ? best->config : default_config_;
}

Clock::time_point EncryptionManager::NowLocked() const {
  return now_();
}

uint64_t EncryptionManager::StoreKeyLocked(EncryptionType algorithm, security::SecretBytes bytes,
                                           uint32_t generation) {
  const uint64_t id = next_key_id_.fetch_add(1, std::memory_order_relaxed);
  EncryptionKey key;
  key.id = id;
  key.algorithm = algorithm;
  key.bytes = std::move(bytes);
  key.created_at = NowLocked();
  key.rotation_count = generation;
  keys_.emplace(id, std::move(key));
  return id;
}

EncryptionKey& EncryptionManager::FindKeyLocked(uint64_t key_id) {
  auto it = keys_.find(key_id);
  if (it == keys_.end()) {
    throw Error{ErrorDomain::NotFound, errors::lookup::kKeyMissing,
                std::string(errors::msg::kKeyNotFound) + ": " + std::to_string(key_id)};
  }
  return it->second;
}

uint64_t EncryptionManager::GenerateKey(EncryptionType algorithm) {
  const auto config = EncryptionConfig::For(algorithm);
  security::SecretBytes bytes(config.key_size);
  crypto::SystemRandomBytes(bytes.mutable_view());
  uint64_t id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = StoreKeyLocked(algorithm, std::move(bytes), 0);
  }
  PublishKeyEvent("key_generated", "Encryption key generated", id, algorithm);
  return id;
}

uint64_t EncryptionManager::ImportKey(EncryptionType algorithm, std::span<const uint8_t> key_bytes) {
  const auto config = EncryptionConfig::For(algorithm);
  if (key_bytes.size() != config.key_size) {
    throw Error{ErrorDomain::InvalidArgument, errors::argument::kWrongKeySize,
                std::string(errors::msg::kWrongKeySize) + ": expected " + std::to_string(config.key_size) +
                    ", got " + std::to_string(key_bytes.size())};
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return StoreKeyLocked(algorithm, security::SecretBytes(key_bytes), 0);
}

uint64_t EncryptionManager::RotateKey(uint64_t key_id) {
  EncryptionType algorithm = EncryptionType::kNone;
  uint32_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& old_key = FindKeyLocked(key_id);
    algorithm = old_key.algorithm;
    generation = old_key.rotation_count + 1;
  }

  security::SecretBytes bytes(EncryptionConfig::For(algorithm).key_size);
  crypto::SystemRandomBytes(bytes.mutable_view());

  uint64_t new_id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& old_key = FindKeyLocked(key_id);
    new_id = StoreKeyLocked(algorithm, std::move(bytes), generation);
    const auto expiry = NowLocked() + grace_period_;
    if (!old_key.expires_at || *old_key.expires_at > expiry) {
      old_key.expires_at = expiry;
    }
    for (auto& [type, active] : active_keys_) {
      if (active == key_id) {
        active = new_id;
      }
    }
    ++stats_.key_rotations;
  }
  PublishKeyEvent("key_rotated", "Encryption key rotated to id " + std::to_string(new_id), key_id, algorithm);
  return new_id;
}

bool EncryptionManager::NeedsRotationLocked(const EncryptionKey& key) const {
  if (key.operation_count >= rotation_threshold_) {
    return true;
  }
  return key.expires_at.has_value() && *key.expires_at <= NowLocked();
}

bool EncryptionManager::NeedsRotation(uint64_t key_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = keys_.find(key_id);
  if (it == keys_.end()) {
    return false;
  }
  return NeedsRotationLocked(it->second);
}

std::size_t EncryptionManager::CleanupExpiredKeys() {
  std::size_t removed = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = NowLocked();
    for (auto it = keys_.begin(); it != keys_.end();) {
      if (it->second.expires_at && *it->second.expires_at <= now) {
        it = keys_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    std::erase_if(active_keys_, [this](const auto& entry) { return keys_.count(entry.second) == 0; });
  }
  if (removed != 0) {
    orchestrator::PublishEvent(
        orchestrator::EventCategory::kSecurity, orchestrator::EventSeverity::kInfo, "keys_expired",
        "Expired encryption keys removed",
        {orchestrator::EventField("count", std::to_string(removed), orchestrator::FieldPrivacy::kPublic, true)});
  }
  return removed;
}

uint64_t EncryptionManager::ActiveKeyFor(EncryptionType algorithm) {
  std::optional<uint64_t> current;
  bool rotate = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = active_keys_.find(algorithm); it != active_keys_.end()) {
      current = it->second;
      rotate = NeedsRotationLocked(FindKeyLocked(it->second));
    }
  }
  if (current && !rotate) {
    return *current;
  }
  const uint64_t id = current ? RotateKey(*current) : GenerateKey(algorithm);
  std::lock_guard<std::mutex> lock(mutex_);
  active_keys_[algorithm] = id;
  return id;
}

std::vector<uint8_t> EncryptionManager::Encrypt(std::span<const uint8_t> data, uint64_t key_id,
                                                std::string_view path) {
  const auto config = GetConfigForPath(path);
  if (config.algorithm == EncryptionType::kNone) {
    return std::vector<uint8_t>(data.begin(), data.end());
  }

  security::SecretBytes key_bytes;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& key = FindKeyLocked(key_id);
    if (key.algorithm != config.algorithm) {
      throw Error{ErrorDomain::InvalidOperation, errors::operation::kAlgorithmMismatch,
                  std::string(errors::msg::kAlgorithmMismatch) + ": key " + std::to_string(key_id) + " is " +
                      std::string(EncryptionTypeName(key.algorithm)) + ", path wants " +
                      std::string(EncryptionTypeName(config.algorithm))};
    }
    key_bytes = key.bytes.Clone();
  }

  std::vector<uint8_t> out(config.iv_size);
  crypto::SystemRandomBytes(out);
  const auto aad = BuildAad(key_id, config.algorithm);
  auto sealed = crypto::AEAD_Encrypt(ToAead(config.algorithm), data, aad,
                                     std::span<const uint8_t>(out.data(), config.iv_size), key_bytes.view());
  out.insert(out.end(), sealed.ciphertext.begin(), sealed.ciphertext.end());
  out.insert(out.end(), sealed.tag.begin(), sealed.tag.end());

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = keys_.find(key_id); it != keys_.end()) {
    ++it->second.operation_count;
  }
  ++stats_.total_encrypted;
  if (config.hw_accel && hardware_aes_) {
    ++stats_.hardware_accelerations;
  }
  return out;
}

std::vector<uint8_t> EncryptionManager::Decrypt(std::span<const uint8_t> data, uint64_t key_id,
                                                std::string_view path) {
  const auto config = GetConfigForPath(path);
  if (config.algorithm == EncryptionType::kNone) {
    return std::vector<uint8_t>(data.begin(), data.end());
  }

  security::SecretBytes key_bytes;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& key = FindKeyLocked(key_id);
    if (key.algorithm != config.algorithm) {
      throw Error{ErrorDomain::InvalidOperation, errors::operation::kAlgorithmMismatch,
                  std::string(errors::msg::kAlgorithmMismatch) + ": key " + std::to_string(key_id)};
    }
    key_bytes = key.bytes.Clone();
  }

  if (data.size() < config.iv_size + config.tag_size) {
    throw Error{ErrorDomain::InvalidFormat, errors::format::kCiphertextTooShort,
                std::string(errors::msg::kCiphertextTooShort) + ": " + std::to_string(data.size()) + " bytes"};
  }
  const auto iv = data.first(config.iv_size);
  const auto tag = data.last<crypto::kAeadTagSize>();
  const auto body = data.subspan(config.iv_size, data.size() - config.iv_size - config.tag_size);
  const auto aad = BuildAad(key_id, config.algorithm);
  auto plaintext = crypto::AEAD_Decrypt(ToAead(config.algorithm), body, aad, iv, tag, key_bytes.view());

  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.total_decrypted;
  if (config.hw_accel && hardware_aes_) {
    ++stats_.hardware_accelerations;
  }
  return plaintext;
}

bool EncryptionManager::HasKey(uint64_t key_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.count(key_id) != 0;
}

std::optional<KeyInfo> EncryptionManager::DescribeKey(uint64_t key_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = keys_.find(key_id);
  if (it == keys_.end()) {
    return std::nullopt;
  }
  const auto& key = it->second;
  return KeyInfo{key.id, key.algorithm, key.created_at, key.expires_at, key.operation_count, key.rotation_count};
}

std::size_t EncryptionManager::KeyCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.size();
}

EncryptionStats EncryptionManager::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void EncryptionManager::SetTimeSourceForTesting(TimeSource source) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ = std::move(source);
}

}  // namespace eclipsefs::encryption
