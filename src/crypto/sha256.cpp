#include "eclipsefs/crypto/sha256.h"

#include "eclipsefs/crypto/provider.h"

namespace eclipsefs::crypto {

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data) {
  auto provider = GetCryptoProviderShared();
  return provider->SHA256(data);
}

std::array<uint8_t, 32> SHA256_Hash(const std::vector<uint8_t>& data) {
  return SHA256_Hash(std::span<const uint8_t>(data.data(), data.size()));
}

std::array<uint8_t, 32> SHA256_Domain(std::string_view domain,
                                      std::initializer_list<std::span<const uint8_t>> parts) {
  std::size_t total = domain.size() + 1;
  for (const auto& part : parts) {
    total += part.size();
  }
  std::vector<uint8_t> input;
  input.reserve(total);
  input.insert(input.end(), domain.begin(), domain.end());
  input.push_back(0);
  for (const auto& part : parts) {
    input.insert(input.end(), part.begin(), part.end());
  }
  return SHA256_Hash(input);
}

}  // namespace eclipsefs::crypto
