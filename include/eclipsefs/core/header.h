#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace eclipsefs::core {

inline constexpr std::array<uint8_t, 8> kImageMagic{'E', 'C', 'L', 'I', 'P', 'S', 'E', '2'};
inline constexpr uint32_t kImageVersion = 0x00020000;
inline constexpr uint32_t kDefaultBlockSize = 4096;
inline constexpr std::size_t kHeaderSize = 512;
inline constexpr std::size_t kInodeTableEntrySize = sizeof(uint32_t) * 2;
inline constexpr uint64_t kDefaultTotalBlocks = 65536;
inline constexpr std::size_t kLabelSize = 100;

namespace features {
inline constexpr uint64_t kCopyOnWrite = 1ull << 0;
inline constexpr uint64_t kChecksums = 1ull << 1;
inline constexpr uint64_t kEncryption = 1ull << 2;
inline constexpr uint64_t kSnapshots = 1ull << 3;
inline constexpr uint64_t kCompression = 1ull << 4;
inline constexpr uint64_t kDedup = 1ull << 5;
inline constexpr uint64_t kAll = kCopyOnWrite | kChecksums | kEncryption | kSnapshots | kCompression | kDedup;
}  // namespace features

// Fixed 512-byte little-endian image header. The two inode table fields live
// at the start of the reserved area and are covered by the header checksum.
struct FsHeader {
  std::array<uint8_t, 8> magic{kImageMagic};
  uint32_t version{kImageVersion};
  uint32_t block_size{kDefaultBlockSize};
  uint64_t total_blocks{0};
  uint64_t free_blocks{0};
  uint64_t inode_table_offset{kHeaderSize};
  uint64_t checksum_table_offset{0};
  uint64_t encryption_info_offset{0};
  uint64_t snapshot_table_offset{0};
  uint64_t compression_info_offset{0};
  uint64_t dedup_table_offset{0};
  uint64_t features{0};
  uint64_t timestamp{0};
  uint32_t header_checksum{0};
  uint64_t inode_table_size{0};
  uint32_t total_inodes{0};
  std::array<uint8_t, kLabelSize> label{}; // NUL padded

  bool operator==(const FsHeader&) const = default;
};

namespace header_layout {
inline constexpr std::size_t kMagic = 0;
inline constexpr std::size_t kVersion = 8;
inline constexpr std::size_t kBlockSize = 12;
inline constexpr std::size_t kTotalBlocks = 16;
inline constexpr std::size_t kFreeBlocks = 24;
inline constexpr std::size_t kInodeTableOffset = 32;
inline constexpr std::size_t kChecksumTableOffset = 40;
inline constexpr std::size_t kEncryptionInfoOffset = 48;
inline constexpr std::size_t kSnapshotTableOffset = 56;
inline constexpr std::size_t kCompressionInfoOffset = 64;
inline constexpr std::size_t kDedupTableOffset = 72;
inline constexpr std::size_t kFeatures = 80;
inline constexpr std::size_t kTimestamp = 88;
inline constexpr std::size_t kHeaderChecksum = 96;
inline constexpr std::size_t kInodeTableSize = 100;
inline constexpr std::size_t kTotalInodes = 108;
inline constexpr std::size_t kLabel = 112;
inline constexpr std::size_t kReservedEnd = kHeaderSize;
static_assert(kLabel + kLabelSize <= kReservedEnd, "header fields overflow fixed size");
}  // namespace header_layout

// At most kLabelSize - 1 bytes; longer labels throw Error{InvalidArgument}.
void SetHeaderLabel(FsHeader& header, std::string_view label);
std::string HeaderLabel(const FsHeader& header);

using HeaderBytes = std::array<uint8_t, kHeaderSize>;

// Serializes every field as stored, including header_checksum.
HeaderBytes SerializeHeader(const FsHeader& header);

// CRC32 over the serialized header with the checksum field zeroed.
uint32_t ComputeHeaderChecksum(std::span<const uint8_t> header_bytes);

// Returns |header| with header_checksum recomputed.
FsHeader SealHeader(FsHeader header);

// True iff the buffer holds a full header with matching magic and checksum.
[[nodiscard]] bool ValidateHeader(std::span<const uint8_t> header_bytes) noexcept;

// Parses and validates. Throws Error{InvalidFormat} on short input, bad magic,
// unsupported major version or checksum mismatch.
FsHeader ParseHeader(std::span<const uint8_t> header_bytes);

struct InodeTableEntry {
  uint32_t inode{0};
  uint32_t relative_offset{0};
};

// Immutable inode-number to record-offset map loaded once per mount.
class InodeTable {
public:
  InodeTable() = default;

  // |table_bytes| must be exactly header.inode_table_size bytes.
  static InodeTable Parse(const FsHeader& header, std::span<const uint8_t> table_bytes);
  static std::vector<uint8_t> Serialize(std::span<const InodeTableEntry> entries);

  [[nodiscard]] std::optional<uint64_t> AbsoluteOffset(uint32_t inode) const;
  [[nodiscard]] bool Contains(uint32_t inode) const { return offsets_.count(inode) != 0; }
  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] const std::vector<InodeTableEntry>& entries() const noexcept { return entries_; }
  [[nodiscard]] uint32_t MaxInode() const noexcept { return max_inode_; }
  [[nodiscard]] uint64_t RecordsStart() const noexcept { return records_start_; }

private:
  std::vector<InodeTableEntry> entries_;
  std::unordered_map<uint32_t, uint64_t> offsets_;
  uint64_t records_start_{0};
  uint32_t max_inode_{0};
};

}  // namespace eclipsefs::core
