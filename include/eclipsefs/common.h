#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace eclipsefs {

// On-disk integers are little-endian and written one byte at a time, so no
// structure layout or host byte order leaks into the image format.
template <std::size_t N>
[[nodiscard]] constexpr std::array<std::uint8_t, N> EncodeLE(std::uint64_t value) noexcept {
  std::array<std::uint8_t, N> out{};
  for (std::size_t i = 0; i < N; ++i) {
    out[i] = static_cast<std::uint8_t>(value >> (8U * i));
  }
  return out;
}

template <std::size_t N>
[[nodiscard]] constexpr std::uint64_t DecodeLE(const std::uint8_t* in) noexcept {
  std::uint64_t value = 0;
  for (std::size_t i = 0; i < N; ++i) {
    value |= static_cast<std::uint64_t>(in[i]) << (8U * i);
  }
  return value;
}

inline void AppendLE16(std::vector<std::uint8_t>& out, std::uint16_t value) {
  const auto bytes = EncodeLE<2>(value);
  out.insert(out.end(), bytes.begin(), bytes.end());
}

inline void AppendLE32(std::vector<std::uint8_t>& out, std::uint32_t value) {
  const auto bytes = EncodeLE<4>(value);
  out.insert(out.end(), bytes.begin(), bytes.end());
}

inline void AppendLE64(std::vector<std::uint8_t>& out, std::uint64_t value) {
  const auto bytes = EncodeLE<8>(value);
  out.insert(out.end(), bytes.begin(), bytes.end());
}

// Store and Load callers check bounds first.
inline void StoreLE32(std::span<std::uint8_t> out, std::size_t offset, std::uint32_t value) noexcept {
  const auto bytes = EncodeLE<4>(value);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[offset + i] = bytes[i];
  }
}

inline void StoreLE64(std::span<std::uint8_t> out, std::size_t offset, std::uint64_t value) noexcept {
  const auto bytes = EncodeLE<8>(value);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[offset + i] = bytes[i];
  }
}

inline std::uint16_t LoadLE16(std::span<const std::uint8_t> in, std::size_t offset) noexcept {
  return static_cast<std::uint16_t>(DecodeLE<2>(in.data() + offset));
}

inline std::uint32_t LoadLE32(std::span<const std::uint8_t> in, std::size_t offset) noexcept {
  return static_cast<std::uint32_t>(DecodeLE<4>(in.data() + offset));
}

inline std::uint64_t LoadLE64(std::span<const std::uint8_t> in, std::size_t offset) noexcept {
  return DecodeLE<8>(in.data() + offset);
}

inline std::string PathToUtf8String(const std::filesystem::path& path) {
#if defined(_WIN32)
  const std::u8string u8 = path.u8string();
  return std::string(u8.begin(), u8.end());
#else
  return path.string();
#endif
}

} // namespace eclipsefs
