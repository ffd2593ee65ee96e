#include "eclipsefs/core/checksum.h"

#include <array>

namespace eclipsefs::core {

namespace {
constexpr uint32_t kCRC32Polynomial = 0xEDB88320u;

constexpr std::array<uint32_t, 256> MakeCRC32Table() {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < table.size(); ++i) {
    uint32_t value = i;
    for (uint32_t bit = 0; bit < 8; ++bit) {
      if (value & 1u) {
        value = (value >> 1) ^ kCRC32Polynomial;
      } else {
        value >>= 1;
      }
    }
    table[i] = value;
  }
  return table;
}

constexpr auto kCRC32Table = MakeCRC32Table();
static_assert(kCRC32Table[1] == 0x77073096u, "CRC32 table generation broken");
}  // namespace

Crc32& Crc32::Update(std::span<const uint8_t> data) noexcept {
  uint32_t crc = state_;
  for (uint8_t byte : data) {
    crc = kCRC32Table[(crc ^ byte) & 0xFFu] ^ (crc >> 8);
  }
  state_ = crc;
  return *this;
}

uint32_t Checksum(std::span<const uint8_t> data) noexcept {
  return Crc32{}.Update(data).Finish();
}

}  // namespace eclipsefs::core
