#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace eclipsefs::tlv {

// Wire form of one attribute: tag:u16, length:u32, value[length], little-endian.
inline constexpr std::size_t kRecordHeaderSize = sizeof(uint16_t) + sizeof(uint32_t);

struct Record {
  uint16_t type{0};
  std::span<const uint8_t> value{};
  std::size_t offset{0}; // offset of the record header inside the parsed buffer
};

// Splits a buffer into records without interpreting them. A trailing partial
// record, or a length that runs past the buffer, leaves the parser invalid.
class Parser {
 public:
  explicit Parser(std::span<const uint8_t> buffer, std::size_t max_records = 4096,
                  std::size_t max_payload = 64 * 1024 * 1024);

  [[nodiscard]] bool valid() const noexcept { return valid_; }
  [[nodiscard]] std::size_t consumed() const noexcept { return consumed_; }
  [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

  [[nodiscard]] auto begin() const noexcept { return records_.begin(); }
  [[nodiscard]] auto end() const noexcept { return records_.end(); }

 private:
  bool valid_{false};
  std::size_t consumed_{0};
  std::vector<Record> records_{};
};

class Writer {
 public:
  Writer& Add(uint16_t type, std::span<const uint8_t> value);
  Writer& AddU8(uint16_t type, uint8_t value);
  Writer& AddU32(uint16_t type, uint32_t value);
  Writer& AddU64(uint16_t type, uint64_t value);

  [[nodiscard]] std::span<const uint8_t> bytes() const noexcept { return buffer_; }
  [[nodiscard]] std::vector<uint8_t> Release() { return std::move(buffer_); }

 private:
  std::vector<uint8_t> buffer_{};
};

}  // namespace eclipsefs::tlv
