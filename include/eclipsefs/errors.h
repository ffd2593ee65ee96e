#pragma once

#include <string_view>

namespace eclipsefs::errors::msg {
// Centralized message catalog.
inline constexpr std::string_view kBadMagic{"Image magic mismatch"};
inline constexpr std::string_view kHeaderChecksumMismatch{"Header checksum mismatch"};
inline constexpr std::string_view kHeaderTruncated{"Image header truncated"};
inline constexpr std::string_view kUnsupportedVersion{"Unsupported image version"};
inline constexpr std::string_view kInodeTableTruncated{"Inode table truncated"};
inline constexpr std::string_view kTlvTruncated{"TLV record truncated"};
inline constexpr std::string_view kTlvLengthMismatch{"TLV field length mismatch"};
inline constexpr std::string_view kUnknownNodeKind{"Unknown node kind"};
inline constexpr std::string_view kMissingNodeKind{"Node record has no kind"};
inline constexpr std::string_view kDirectoryEntriesTruncated{"Directory entries truncated"};
inline constexpr std::string_view kNodeChecksumMismatch{"Node checksum mismatch"};
inline constexpr std::string_view kNodeChecksumMissing{"Node record has no trailing checksum"};
inline constexpr std::string_view kNodeRecordTooSmall{"Node record size smaller than its header"};
inline constexpr std::string_view kInodeMismatch{"Inode number in record does not match table"};
inline constexpr std::string_view kBlockMagicMismatch{"Block magic mismatch"};
inline constexpr std::string_view kBlockHeaderChecksumMismatch{"Block header checksum mismatch"};
inline constexpr std::string_view kBlockPayloadChecksumMismatch{"Block payload checksum mismatch"};
inline constexpr std::string_view kBlockPayloadTooLarge{"Block payload exceeds block capacity"};
inline constexpr std::string_view kCiphertextTooShort{"Ciphertext shorter than IV and tag"};
inline constexpr std::string_view kNotADirectory{"Path component is not a directory"};
inline constexpr std::string_view kIsADirectory{"Cannot write file data to a directory"};
inline constexpr std::string_view kAlgorithmMismatch{"Key algorithm does not match path policy"};
inline constexpr std::string_view kWrongKeySize{"Key size does not match algorithm"};
inline constexpr std::string_view kKeyNotFound{"Encryption key not found"};
inline constexpr std::string_view kDedupEntryNotFound{"Dedup entry not found"};
inline constexpr std::string_view kSnapshotNotFound{"Snapshot not found"};
inline constexpr std::string_view kNoFreeBlocks{"No free blocks left"};
inline constexpr std::string_view kCipherUnavailable{"Cipher not available in this build"};
inline constexpr std::string_view kZstdCompressFailed{"zstd compression failed"};
inline constexpr std::string_view kZstdDecompressFailed{"zstd decompression failed"};
}  // namespace eclipsefs::errors::msg
