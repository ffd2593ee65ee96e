#pragma once

#include <cstdint>
#include <span>

namespace eclipsefs::core {

// CRC-32 (IEEE 802.3, reflected polynomial 0xEDB88320) used for the image
// header, node records and block headers/payloads.
class Crc32 {
public:
  static constexpr uint32_t kInitial = 0xFFFFFFFFu;

  Crc32& Update(std::span<const uint8_t> data) noexcept;
  [[nodiscard]] uint32_t Finish() const noexcept { return state_ ^ 0xFFFFFFFFu; }

private:
  uint32_t state_{kInitial};
};

[[nodiscard]] uint32_t Checksum(std::span<const uint8_t> data) noexcept;

}  // namespace eclipsefs::core
