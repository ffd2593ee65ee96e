#include "eclipsefs/core/checksum.h"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <span>
#include <string_view>
#include <vector>

namespace {

std::span<const uint8_t> Bytes(std::string_view text) {
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

void TestKnownVectors() {
  assert(eclipsefs::core::Checksum({}) == 0x00000000u && "empty input must hash to zero");
  assert(eclipsefs::core::Checksum(Bytes("123456789")) == 0xCBF43926u && "CRC-32 check value");
  assert(eclipsefs::core::Checksum(Bytes("The quick brown fox jumps over the lazy dog")) == 0x414FA339u &&
         "CRC-32 pangram vector");
}

void TestIncrementalMatchesOneShot() {
  std::vector<uint8_t> data(1000);
  for (std::size_t i = 0; i < data.size(); ++i) {
    data[i] = static_cast<uint8_t>(i * 31 + 7);
  }
  eclipsefs::core::Crc32 crc;
  crc.Update(std::span<const uint8_t>(data).first(333));
  crc.Update(std::span<const uint8_t>(data).subspan(333, 1));
  crc.Update(std::span<const uint8_t>(data).subspan(334));
  assert(crc.Finish() == eclipsefs::core::Checksum(data) && "split updates must match one-shot checksum");
}

void TestSingleBitFlipDetected() {
  std::vector<uint8_t> data(512, 0xA5);
  const uint32_t original = eclipsefs::core::Checksum(data);
  for (std::size_t bit = 0; bit < data.size() * 8; bit += 97) {
    auto corrupted = data;
    corrupted[bit / 8] ^= static_cast<uint8_t>(1u << (bit % 8));
    assert(eclipsefs::core::Checksum(corrupted) != original && "single bit flip must change the checksum");
  }
}

}  // namespace

int main() {
  TestKnownVectors();
  TestIncrementalMatchesOneShot();
  TestSingleBitFlipDetected();
  std::cout << "checksum tests ok\n";
  return 0;
}
