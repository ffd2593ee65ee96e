#include "eclipsefs/storage/compression.h"

#include <zstd.h>

#include <string>

#include "eclipsefs/error.h"
#include "eclipsefs/errors.h"

namespace eclipsefs::storage {

std::string_view CompressionTypeName(CompressionType type) noexcept {
  switch (type) {
    case CompressionType::kNone:
      return "none";
    case CompressionType::kZstd:
      return "zstd";
  }
  return "unknown";
}

std::optional<CompressionType> ParseCompressionType(std::string_view text) {
  if (text == "none") {
    return CompressionType::kNone;
  }
  if (text == "zstd") {
    return CompressionType::kZstd;
  }
  return std::nullopt;
}

std::optional<std::vector<uint8_t>> ZstdCompressIfSmaller(std::span<const uint8_t> input, int level) {
  if (input.empty()) {
    return std::nullopt;
  }
  size_t bound = ZSTD_compressBound(input.size());
  std::vector<uint8_t> compressed(bound);
  size_t compressed_size = ZSTD_compress(compressed.data(), bound, input.data(), input.size(), level);
  if (ZSTD_isError(compressed_size)) {
    return std::nullopt;
  }
  compressed.resize(compressed_size);
  if (compressed.size() >= input.size()) {
    return std::nullopt;
  }
  return compressed;
}

std::vector<uint8_t> ZstdDecompress(std::span<const uint8_t> frame, std::size_t original_size) {
  std::vector<uint8_t> out(original_size);
  size_t result = ZSTD_decompress(out.data(), out.size(), frame.data(), frame.size());
  if (ZSTD_isError(result) || result != original_size) {
    std::string message(errors::msg::kZstdDecompressFailed);
    if (ZSTD_isError(result)) {
      message += ": ";
      message += ZSTD_getErrorName(result);
    }
    throw Error{ErrorDomain::InvalidFormat, errors::format::kCorruptCompressedPayload, message};
  }
  return out;
}

}  // namespace eclipsefs::storage
