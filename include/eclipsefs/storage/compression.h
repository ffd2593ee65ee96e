#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace eclipsefs::storage {

// Stored in block headers as a single byte.
enum class CompressionType : uint8_t { kNone = 0, kZstd = 1 };

std::string_view CompressionTypeName(CompressionType type) noexcept;
std::optional<CompressionType> ParseCompressionType(std::string_view text);

// Returns nullopt when zstd fails or the frame is not smaller than |input|.
std::optional<std::vector<uint8_t>> ZstdCompressIfSmaller(std::span<const uint8_t> input, int level);

// Throws Error{InvalidFormat} unless the frame inflates to exactly
// |original_size| bytes.
std::vector<uint8_t> ZstdDecompress(std::span<const uint8_t> frame, std::size_t original_size);

}  // namespace eclipsefs::storage
