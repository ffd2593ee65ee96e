#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace eclipsefs::crypto {

enum class AeadAlgorithm : uint8_t {
  kAes256Gcm = 1,
  kChaCha20Poly1305 = 2,
  kXChaCha20Poly1305 = 3,
};

struct AeadParameters {
  std::size_t key_size;
  std::size_t nonce_size;
  std::size_t tag_size;
};

inline constexpr std::size_t kAeadTagSize = 16;

constexpr AeadParameters ParametersFor(AeadAlgorithm algorithm) noexcept {
  switch (algorithm) {
    case AeadAlgorithm::kAes256Gcm:
    case AeadAlgorithm::kChaCha20Poly1305:
      return {32, 12, kAeadTagSize};
    case AeadAlgorithm::kXChaCha20Poly1305:
      return {32, 24, kAeadTagSize};
  }
  return {0, 0, 0};
}

std::string_view AeadAlgorithmName(AeadAlgorithm algorithm) noexcept;

struct AeadResult {
  std::vector<uint8_t> ciphertext;
  std::array<uint8_t, kAeadTagSize> tag{};
};

// False when the build lacks the backend for |algorithm| (XChaCha20 without
// libsodium).
[[nodiscard]] bool CipherAvailable(AeadAlgorithm algorithm) noexcept;

// Key and nonce lengths must match ParametersFor(algorithm); otherwise
// Error{InvalidArgument}. Provider failures throw Error{Crypto}.
AeadResult AEAD_Encrypt(AeadAlgorithm algorithm,
                        std::span<const uint8_t> plaintext,
                        std::span<const uint8_t> aad,
                        std::span<const uint8_t> nonce,
                        std::span<const uint8_t> key);

// Throws AuthenticationFailureError when |tag| does not authenticate
// |ciphertext| and |aad|.
std::vector<uint8_t> AEAD_Decrypt(AeadAlgorithm algorithm,
                                  std::span<const uint8_t> ciphertext,
                                  std::span<const uint8_t> aad,
                                  std::span<const uint8_t> nonce,
                                  std::span<const uint8_t, kAeadTagSize> tag,
                                  std::span<const uint8_t> key);

}  // namespace eclipsefs::crypto
