#pragma once

#include <array>
#include <memory>
#include <span>
#include <vector>

#include "eclipsefs/crypto/aead.h"

namespace eclipsefs::crypto {

class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  [[nodiscard]] virtual bool SupportsAEAD(AeadAlgorithm algorithm) const noexcept = 0;

  virtual AeadResult EncryptAEAD(AeadAlgorithm algorithm,
                                 std::span<const uint8_t> plaintext,
                                 std::span<const uint8_t> aad,
                                 std::span<const uint8_t> nonce,
                                 std::span<const uint8_t> key) = 0;

  // Throws AuthenticationFailureError on tag mismatch.
  virtual std::vector<uint8_t> DecryptAEAD(AeadAlgorithm algorithm,
                                           std::span<const uint8_t> ciphertext,
                                           std::span<const uint8_t> aad,
                                           std::span<const uint8_t> nonce,
                                           std::span<const uint8_t, kAeadTagSize> tag,
                                           std::span<const uint8_t> key) = 0;

  virtual std::array<uint8_t, 32> SHA256(std::span<const uint8_t> data) = 0;
};

// OpenSSL EVP for AES-256-GCM, ChaCha20-Poly1305 and SHA-256; libsodium for
// XChaCha20-Poly1305 when the build has it.
class OpenSSLCryptoProvider : public CryptoProvider {
public:
  [[nodiscard]] bool SupportsAEAD(AeadAlgorithm algorithm) const noexcept override;

  AeadResult EncryptAEAD(AeadAlgorithm algorithm,
                         std::span<const uint8_t> plaintext,
                         std::span<const uint8_t> aad,
                         std::span<const uint8_t> nonce,
                         std::span<const uint8_t> key) override;

  std::vector<uint8_t> DecryptAEAD(AeadAlgorithm algorithm,
                                   std::span<const uint8_t> ciphertext,
                                   std::span<const uint8_t> aad,
                                   std::span<const uint8_t> nonce,
                                   std::span<const uint8_t, kAeadTagSize> tag,
                                   std::span<const uint8_t> key) override;

  std::array<uint8_t, 32> SHA256(std::span<const uint8_t> data) override;
};

// Process-wide provider, created on first use.
std::shared_ptr<CryptoProvider> GetCryptoProviderShared();

// True when the CPU advertises AES instructions (AES-NI or ARMv8 AES).
[[nodiscard]] bool HardwareAesAvailable();

}  // namespace eclipsefs::crypto
