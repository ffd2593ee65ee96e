#include "eclipsefs/crypto/aead.h"

#include "eclipsefs/crypto/provider.h"

namespace eclipsefs::crypto {

std::string_view AeadAlgorithmName(AeadAlgorithm algorithm) noexcept {
  switch (algorithm) {
    case AeadAlgorithm::kAes256Gcm:
      return "AES-256-GCM";
    case AeadAlgorithm::kChaCha20Poly1305:
      return "ChaCha20-Poly1305";
    case AeadAlgorithm::kXChaCha20Poly1305:
      return "XChaCha20-Poly1305";
  }
  return "unknown";
}

bool CipherAvailable(AeadAlgorithm algorithm) noexcept {
  try {
    return GetCryptoProviderShared()->SupportsAEAD(algorithm);
  } catch (const std::exception&) {
    return false; // provider failed its self-test
  }
}

AeadResult AEAD_Encrypt(AeadAlgorithm algorithm,
                        std::span<const uint8_t> plaintext,
                        std::span<const uint8_t> aad,
                        std::span<const uint8_t> nonce,
                        std::span<const uint8_t> key) {
  auto provider = GetCryptoProviderShared();
  return provider->EncryptAEAD(algorithm, plaintext, aad, nonce, key);
}

std::vector<uint8_t> AEAD_Decrypt(AeadAlgorithm algorithm,
                                  std::span<const uint8_t> ciphertext,
                                  std::span<const uint8_t> aad,
                                  std::span<const uint8_t> nonce,
                                  std::span<const uint8_t, kAeadTagSize> tag,
                                  std::span<const uint8_t> key) {
  auto provider = GetCryptoProviderShared();
  return provider->DecryptAEAD(algorithm, ciphertext, aad, nonce, tag, key);
}

}  // namespace eclipsefs::crypto
