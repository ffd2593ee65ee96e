#include "eclipsefs/crypto/provider.h"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>

#if ECLIPSEFS_HAVE_SODIUM
#include <sodium.h>
#endif

#if defined(__GNUC__) && (defined(__x86_64__) || defined(__i386__))
#include <cpuid.h>
#endif

#if defined(__linux__) && defined(__aarch64__)
#include <asm/hwcap.h>
#include <sys/auxv.h>
#endif

#include <array>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "eclipsefs/error.h"
#include "eclipsefs/errors.h"

namespace eclipsefs::crypto {

namespace {

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

[[noreturn]] void ThrowCryptoError(const std::string& message, int code = errors::crypto::kProviderFailure,
                                   std::optional<int> native = std::nullopt) {
  throw Error(ErrorDomain::Crypto, code, message, native);
}

class EVPContextDeleter {
public:
  void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EVPContextDeleter>;

const EVP_CIPHER* EvpCipherFor(AeadAlgorithm algorithm) {
  switch (algorithm) {
    case AeadAlgorithm::kAes256Gcm:
      return EVP_aes_256_gcm();
    case AeadAlgorithm::kChaCha20Poly1305:
      return EVP_chacha20_poly1305();
    case AeadAlgorithm::kXChaCha20Poly1305:
      break;
  }
  return nullptr;
}

void CheckSizes(AeadAlgorithm algorithm, std::span<const uint8_t> nonce,
                std::span<const uint8_t> key) {
  const auto params = ParametersFor(algorithm);
  if (key.size() != params.key_size) {
    throw Error(ErrorDomain::InvalidArgument, errors::argument::kWrongKeySize,
                std::string(errors::msg::kWrongKeySize) + " (" +
                    std::string(AeadAlgorithmName(algorithm)) + ")");
  }
  if (nonce.size() != params.nonce_size) {
    throw Error(ErrorDomain::InvalidArgument, errors::argument::kWrongNonceSize,
                "Nonce size does not match " + std::string(AeadAlgorithmName(algorithm)));
  }
}

struct HardwareCapabilities {
  bool aes{false};
  bool pclmul{false};
};

struct RuntimeState {
  std::once_flag once;
  HardwareCapabilities caps{};
};

RuntimeState& MutableRuntimeState() {
  static RuntimeState state{};
  return state;
}

HardwareCapabilities DetectHardwareCapabilities() {
  HardwareCapabilities caps{};
#if defined(__GNUC__) && (defined(__x86_64__) || defined(__i386__))
  unsigned int eax = 0;
  unsigned int ebx = 0;
  unsigned int ecx = 0;
  unsigned int edx = 0;
  if (__get_cpuid_max(0, nullptr) >= 1) {
    __cpuid(1, eax, ebx, ecx, edx);
    caps.aes = (ecx & (1u << 25)) != 0;
    caps.pclmul = (ecx & (1u << 1)) != 0;
  }
#elif defined(__linux__) && defined(__aarch64__)
  unsigned long hwcap = getauxval(AT_HWCAP);
#ifdef HWCAP_AES
  caps.aes = (hwcap & HWCAP_AES) != 0;
#endif
#ifdef HWCAP_PMULL
  caps.pclmul = (hwcap & HWCAP_PMULL) != 0;
#endif
#endif
  return caps;
}

std::mutex& ProviderMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<CryptoProvider>& ProviderInstance() {
  static std::shared_ptr<CryptoProvider> instance;
  return instance;
}

// AES-256-GCM test case 16 from the GCM submission (60-byte plaintext, 20-byte AAD).
void RunAESGCMKnownAnswerTest() {
  static constexpr std::array<uint8_t, 32> kKey{
      0xfe, 0xff, 0xe9, 0x92, 0x86, 0x65, 0x73, 0x1c,
      0x6d, 0x6a, 0x8f, 0x94, 0x67, 0x30, 0x83, 0x08,
      0xfe, 0xff, 0xe9, 0x92, 0x86, 0x65, 0x73, 0x1c,
      0x6d, 0x6a, 0x8f, 0x94, 0x67, 0x30, 0x83, 0x08};
  static constexpr std::array<uint8_t, 12> kNonce{
      0xca, 0xfe, 0xba, 0xbe, 0xfa, 0xce,
      0xdb, 0xad, 0xde, 0xca, 0xf8, 0x88};
  static constexpr std::array<uint8_t, 60> kPlaintext{
      0xd9, 0x31, 0x32, 0x25, 0xf8, 0x84, 0x06, 0xe5, 0xa5, 0x59, 0x09, 0xc5,
      0xaf, 0xf5, 0x26, 0x9a, 0x86, 0xa7, 0xa9, 0x53, 0x15, 0x34, 0xf7, 0xda,
      0x2e, 0x4c, 0x30, 0x3d, 0x8a, 0x31, 0x8a, 0x72, 0x1c, 0x3c, 0x0c, 0x95,
      0x95, 0x68, 0x09, 0x53, 0x2f, 0xcf, 0x0e, 0x24, 0x49, 0xa6, 0xb5, 0x25,
      0xb1, 0x6a, 0xed, 0xf5, 0xaa, 0x0d, 0xe6, 0x57, 0xba, 0x63, 0x7b, 0x39};
  static constexpr std::array<uint8_t, 20> kAad{
      0xfe, 0xed, 0xfa, 0xce, 0xde, 0xad, 0xbe, 0xef, 0xfe, 0xed,
      0xfa, 0xce, 0xde, 0xad, 0xbe, 0xef, 0xab, 0xad, 0xda, 0xd2};
  static constexpr std::array<uint8_t, 60> kExpectedCiphertext{
      0x52, 0x2d, 0xc1, 0xf0, 0x99, 0x56, 0x7d, 0x07, 0xf4, 0x7f, 0x37, 0xa3,
      0x2a, 0x84, 0x42, 0x7d, 0x64, 0x3a, 0x8c, 0xdc, 0xbf, 0xe5, 0xc0, 0xc9,
      0x75, 0x98, 0xa2, 0xbd, 0x25, 0x55, 0xd1, 0xaa, 0x8c, 0xb0, 0x8e, 0x48,
      0x59, 0x0d, 0xbb, 0x3d, 0xa7, 0xb0, 0x8b, 0x10, 0x56, 0x82, 0x88, 0x38,
      0xc5, 0xf6, 0x1e, 0x63, 0x93, 0xba, 0x7a, 0x0a, 0xbc, 0xc9, 0xf6, 0x62};
  static constexpr std::array<uint8_t, kAeadTagSize> kExpectedTag{
      0x76, 0xfc, 0x6e, 0xce, 0x0f, 0x4e, 0x17, 0x68,
      0xcd, 0xdf, 0x88, 0x53, 0xbb, 0x2d, 0x55, 0x1b};

  OpenSSLCryptoProvider provider;
  const auto enc = provider.EncryptAEAD(AeadAlgorithm::kAes256Gcm, kPlaintext, kAad, kNonce, kKey);
  if (enc.ciphertext.size() != kExpectedCiphertext.size() ||
      CRYPTO_memcmp(enc.ciphertext.data(), kExpectedCiphertext.data(), kExpectedCiphertext.size()) != 0) {
    ThrowCryptoError("AES-GCM KAT ciphertext mismatch", errors::crypto::kSelfTestFailed);
  }
  if (CRYPTO_memcmp(enc.tag.data(), kExpectedTag.data(), kExpectedTag.size()) != 0) {
    ThrowCryptoError("AES-GCM KAT tag mismatch", errors::crypto::kSelfTestFailed);
  }

  const auto dec = provider.DecryptAEAD(AeadAlgorithm::kAes256Gcm, enc.ciphertext, kAad, kNonce,
                                        std::span<const uint8_t, kAeadTagSize>(enc.tag), kKey);
  if (dec.size() != kPlaintext.size() ||
      CRYPTO_memcmp(dec.data(), kPlaintext.data(), kPlaintext.size()) != 0) {
    ThrowCryptoError("AES-GCM KAT decrypt mismatch", errors::crypto::kSelfTestFailed);
  }
}

void EnsureCryptoRuntimeConfigured() {
  auto& state = MutableRuntimeState();
  std::call_once(state.once, [&state]() {
#if ECLIPSEFS_HAVE_SODIUM
    if (sodium_init() < 0) {
      ThrowCryptoError("sodium_init failed");
    }
#endif
    state.caps = DetectHardwareCapabilities();
    RunAESGCMKnownAnswerTest();
  });
}

#if ECLIPSEFS_HAVE_SODIUM
AeadResult SodiumXChaChaEncrypt(std::span<const uint8_t> plaintext, std::span<const uint8_t> aad,
                                std::span<const uint8_t> nonce, std::span<const uint8_t> key) {
  AeadResult result;
  result.ciphertext.resize(plaintext.size());
  unsigned long long tag_len = 0;
  if (crypto_aead_xchacha20poly1305_ietf_encrypt_detached(
          result.ciphertext.data(), result.tag.data(), &tag_len, plaintext.data(), plaintext.size(),
          aad.data(), aad.size(), nullptr, nonce.data(), key.data()) != 0) {
    ThrowCryptoError("crypto_aead_xchacha20poly1305_ietf_encrypt_detached failed");
  }
  if (tag_len != result.tag.size()) {
    ThrowCryptoError("Unexpected XChaCha20-Poly1305 tag length", errors::crypto::kProviderFailure,
                     static_cast<int>(tag_len));
  }
  return result;
}

std::vector<uint8_t> SodiumXChaChaDecrypt(std::span<const uint8_t> ciphertext,
                                          std::span<const uint8_t> aad,
                                          std::span<const uint8_t> nonce,
                                          std::span<const uint8_t, kAeadTagSize> tag,
                                          std::span<const uint8_t> key) {
  std::vector<uint8_t> plaintext(ciphertext.size());
  if (crypto_aead_xchacha20poly1305_ietf_decrypt_detached(
          plaintext.data(), nullptr, ciphertext.data(), ciphertext.size(), tag.data(), aad.data(),
          aad.size(), nonce.data(), key.data()) != 0) {
    throw AuthenticationFailureError("XChaCha20-Poly1305 authentication failed");
  }
  return plaintext;
}
#endif

}  // namespace

bool HardwareAesAvailable() {
  EnsureCryptoRuntimeConfigured();
  return MutableRuntimeState().caps.aes;
}

bool OpenSSLCryptoProvider::SupportsAEAD(AeadAlgorithm algorithm) const noexcept {
  switch (algorithm) {
    case AeadAlgorithm::kAes256Gcm:
    case AeadAlgorithm::kChaCha20Poly1305:
      return true;
    case AeadAlgorithm::kXChaCha20Poly1305:
      return ECLIPSEFS_HAVE_SODIUM != 0;
  }
  return false;
}

AeadResult OpenSSLCryptoProvider::EncryptAEAD(AeadAlgorithm algorithm,
                                              std::span<const uint8_t> plaintext,
                                              std::span<const uint8_t> aad,
                                              std::span<const uint8_t> nonce,
                                              std::span<const uint8_t> key) {
  CheckSizes(algorithm, nonce, key);
  if (algorithm == AeadAlgorithm::kXChaCha20Poly1305) {
#if ECLIPSEFS_HAVE_SODIUM
    return SodiumXChaChaEncrypt(plaintext, aad, nonce, key);
#else
    ThrowCryptoError(std::string(errors::msg::kCipherUnavailable) + ": XChaCha20-Poly1305",
                     errors::crypto::kCipherUnavailable);
#endif
  }

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AEAD context");
  }

  if (EVP_EncryptInit_ex(ctx.get(), EvpCipherFor(algorithm), nullptr, nullptr, nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptInit_ex"));
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN,
                          static_cast<int>(nonce.size()), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_AEAD_SET_IVLEN"));
  }
  if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptInit_ex key/iv"));
  }

  int len = 0;
  if (!aad.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(),
                          static_cast<int>(aad.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptUpdate aad"));
    }
  }

  AeadResult result;
  // One spare block for EncryptFinal; stream-mode AEADs never use it.
  result.ciphertext.resize(plaintext.size() + 16);
  int total = 0;
  if (!plaintext.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), result.ciphertext.data(), &len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptUpdate plaintext"));
    }
    total = len;
  }

  if (EVP_EncryptFinal_ex(ctx.get(), result.ciphertext.data() + total, &len) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptFinal_ex"));
  }
  total += len;
  result.ciphertext.resize(static_cast<size_t>(total));

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG,
                          static_cast<int>(result.tag.size()), result.tag.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_AEAD_GET_TAG"));
  }

  return result;
}

std::vector<uint8_t> OpenSSLCryptoProvider::DecryptAEAD(AeadAlgorithm algorithm,
                                                        std::span<const uint8_t> ciphertext,
                                                        std::span<const uint8_t> aad,
                                                        std::span<const uint8_t> nonce,
                                                        std::span<const uint8_t, kAeadTagSize> tag,
                                                        std::span<const uint8_t> key) {
  CheckSizes(algorithm, nonce, key);
  if (algorithm == AeadAlgorithm::kXChaCha20Poly1305) {
#if ECLIPSEFS_HAVE_SODIUM
    return SodiumXChaChaDecrypt(ciphertext, aad, nonce, tag, key);
#else
    ThrowCryptoError(std::string(errors::msg::kCipherUnavailable) + ": XChaCha20-Poly1305",
                     errors::crypto::kCipherUnavailable);
#endif
  }

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AEAD context");
  }

  if (EVP_DecryptInit_ex(ctx.get(), EvpCipherFor(algorithm), nullptr, nullptr, nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptInit_ex"));
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN,
                          static_cast<int>(nonce.size()), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_AEAD_SET_IVLEN"));
  }
  if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptInit_ex key/iv"));
  }

  int len = 0;
  if (!aad.empty()) {
    if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(),
                          static_cast<int>(aad.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptUpdate aad"));
    }
  }

  std::vector<uint8_t> plaintext(ciphertext.size() + 16);
  int total = 0;
  if (!ciphertext.empty()) {
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptUpdate ciphertext"));
    }
    total = len;
  }

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tag.size()),
                          const_cast<uint8_t*>(tag.data())) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_AEAD_SET_TAG"));
  }

  int final_len = 0;
  int ret = EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &final_len);
  if (ret <= 0) {
    throw AuthenticationFailureError(
        BuildOpenSSLErrorMessage("EVP_DecryptFinal_ex (authentication failed)"));
  }
  total += final_len;
  plaintext.resize(static_cast<size_t>(total));

  return plaintext;
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::SHA256(std::span<const uint8_t> data) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_Digest(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected SHA-256 length", errors::crypto::kProviderFailure, static_cast<int>(len));
  }
  return out;
}

std::shared_ptr<CryptoProvider> GetCryptoProviderShared() {
  EnsureCryptoRuntimeConfigured();
  std::lock_guard<std::mutex> lock(ProviderMutex());
  auto& provider = ProviderInstance();
  if (!provider) {
    provider = std::make_shared<OpenSSLCryptoProvider>();
  }
  return provider;
}

}  // namespace eclipsefs::crypto
