#pragma once
#include <array>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>
#include <vector>

namespace eclipsefs::crypto {
std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data);
std::array<uint8_t, 32> SHA256_Hash(const std::vector<uint8_t>& data);

// SHA-256 over |domain| NUL |parts...|. Digests from distinct domains never
// share an input, whatever bytes the parts hold.
std::array<uint8_t, 32> SHA256_Domain(std::string_view domain,
                                      std::initializer_list<std::span<const uint8_t>> parts);
} // namespace eclipsefs::crypto
