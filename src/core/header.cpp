#include "eclipsefs/core/header.h"

#include <algorithm>
#include <string>

#include "eclipsefs/common.h"
#include "eclipsefs/core/checksum.h"
#include "eclipsefs/error.h"
#include "eclipsefs/errors.h"

namespace eclipsefs::core {

namespace {
constexpr uint32_t kSupportedMajorVersion = kImageVersion >> 16;
}  // namespace

HeaderBytes SerializeHeader(const FsHeader& header) {
  namespace L = header_layout;
  HeaderBytes bytes{};
  std::span<uint8_t> out(bytes);
  std::copy(header.magic.begin(), header.magic.end(), bytes.begin() + L::kMagic);
  StoreLE32(out, L::kVersion, header.version);
  StoreLE32(out, L::kBlockSize, header.block_size);
  StoreLE64(out, L::kTotalBlocks, header.total_blocks);
  StoreLE64(out, L::kFreeBlocks, header.free_blocks);
  StoreLE64(out, L::kInodeTableOffset, header.inode_table_offset);
  StoreLE64(out, L::kChecksumTableOffset, header.checksum_table_offset);
  StoreLE64(out, L::kEncryptionInfoOffset, header.encryption_info_offset);
  StoreLE64(out, L::kSnapshotTableOffset, header.snapshot_table_offset);
  StoreLE64(out, L::kCompressionInfoOffset, header.compression_info_offset);
  StoreLE64(out, L::kDedupTableOffset, header.dedup_table_offset);
  StoreLE64(out, L::kFeatures, header.features);
  StoreLE64(out, L::kTimestamp, header.timestamp);
  StoreLE32(out, L::kHeaderChecksum, header.header_checksum);
  StoreLE64(out, L::kInodeTableSize, header.inode_table_size);
  StoreLE32(out, L::kTotalInodes, header.total_inodes);
  std::copy(header.label.begin(), header.label.end(), bytes.begin() + L::kLabel);
  return bytes;
}

void SetHeaderLabel(FsHeader& header, std::string_view label) {
  if (label.size() >= kLabelSize || label.find('\0') != std::string_view::npos) {
    throw Error{ErrorDomain::InvalidArgument, errors::argument::kInvalidName,
                "Image label must be under " + std::to_string(kLabelSize) + " bytes without NUL"};
  }
  header.label.fill(0);
  std::copy(label.begin(), label.end(), header.label.begin());
}

std::string HeaderLabel(const FsHeader& header) {
  auto end = std::find(header.label.begin(), header.label.end(), uint8_t{0});
  return std::string(header.label.begin(), end);
}

uint32_t ComputeHeaderChecksum(std::span<const uint8_t> header_bytes) {
  namespace L = header_layout;
  static constexpr std::array<uint8_t, sizeof(uint32_t)> kZeroChecksum{};
  Crc32 crc;
  crc.Update(header_bytes.first(L::kHeaderChecksum));
  crc.Update(kZeroChecksum);
  crc.Update(header_bytes.subspan(L::kHeaderChecksum + sizeof(uint32_t),
                                  kHeaderSize - L::kHeaderChecksum - sizeof(uint32_t)));
  return crc.Finish();
}

FsHeader SealHeader(FsHeader header) {
  header.header_checksum = 0;
  const auto bytes = SerializeHeader(header);
  header.header_checksum = ComputeHeaderChecksum(bytes);
  return header;
}

bool ValidateHeader(std::span<const uint8_t> header_bytes) noexcept {
  if (header_bytes.size() < kHeaderSize) {
    return false;
  }
  if (!std::equal(kImageMagic.begin(), kImageMagic.end(), header_bytes.begin())) {
    return false;
  }
  const uint32_t stored = LoadLE32(header_bytes, header_layout::kHeaderChecksum);
  return stored == ComputeHeaderChecksum(header_bytes.first(kHeaderSize));
}

FsHeader ParseHeader(std::span<const uint8_t> header_bytes) {
  namespace L = header_layout;
  if (header_bytes.size() < kHeaderSize) {
    throw Error{ErrorDomain::InvalidFormat, errors::format::kTruncatedRecord,
                std::string(errors::msg::kHeaderTruncated)};
  }
  if (!std::equal(kImageMagic.begin(), kImageMagic.end(), header_bytes.begin())) {
    throw Error{ErrorDomain::InvalidFormat, errors::format::kBadMagic, std::string(errors::msg::kBadMagic)};
  }

  FsHeader header;
  std::copy_n(header_bytes.begin(), header.magic.size(), header.magic.begin());
  header.version = LoadLE32(header_bytes, L::kVersion);
  header.block_size = LoadLE32(header_bytes, L::kBlockSize);
  header.total_blocks = LoadLE64(header_bytes, L::kTotalBlocks);
  header.free_blocks = LoadLE64(header_bytes, L::kFreeBlocks);
  header.inode_table_offset = LoadLE64(header_bytes, L::kInodeTableOffset);
  header.checksum_table_offset = LoadLE64(header_bytes, L::kChecksumTableOffset);
  header.encryption_info_offset = LoadLE64(header_bytes, L::kEncryptionInfoOffset);
  header.snapshot_table_offset = LoadLE64(header_bytes, L::kSnapshotTableOffset);
  header.compression_info_offset = LoadLE64(header_bytes, L::kCompressionInfoOffset);
  header.dedup_table_offset = LoadLE64(header_bytes, L::kDedupTableOffset);
  header.features = LoadLE64(header_bytes, L::kFeatures);
  header.timestamp = LoadLE64(header_bytes, L::kTimestamp);
  header.header_checksum = LoadLE32(header_bytes, L::kHeaderChecksum);
  header.inode_table_size = LoadLE64(header_bytes, L::kInodeTableSize);
  header.total_inodes = LoadLE32(header_bytes, L::kTotalInodes);
  std::copy_n(header_bytes.begin() + L::kLabel, kLabelSize, header.label.begin());

  if (header.header_checksum != ComputeHeaderChecksum(header_bytes.first(kHeaderSize))) {
    throw Error{ErrorDomain::InvalidFormat, errors::format::kHeaderChecksum,
                std::string(errors::msg::kHeaderChecksumMismatch)};
  }
  if ((header.version >> 16) != kSupportedMajorVersion) {
    throw Error{ErrorDomain::InvalidFormat, errors::format::kUnsupportedVersion,
                std::string(errors::msg::kUnsupportedVersion) + ": " + std::to_string(header.version)};
  }
  if (header.block_size < 512 || (header.block_size & (header.block_size - 1)) != 0) {
    throw Error{ErrorDomain::InvalidFormat, errors::format::kMalformedTlv,
                "Block size must be a power of two of at least 512 bytes"};
  }
  return header;
}

InodeTable InodeTable::Parse(const FsHeader& header, std::span<const uint8_t> table_bytes) {
  const uint64_t expected = static_cast<uint64_t>(header.total_inodes) * kInodeTableEntrySize;
  if (header.inode_table_size != expected || table_bytes.size() != expected) {
    throw Error{ErrorDomain::InvalidFormat, errors::format::kTruncatedRecord,
                std::string(errors::msg::kInodeTableTruncated)};
  }

  InodeTable table;
  table.records_start_ = header.inode_table_offset + header.inode_table_size;
  table.entries_.reserve(header.total_inodes);
  table.offsets_.reserve(header.total_inodes);
  for (std::size_t offset = 0; offset < table_bytes.size(); offset += kInodeTableEntrySize) {
    InodeTableEntry entry;
    entry.inode = LoadLE32(table_bytes, offset);
    entry.relative_offset = LoadLE32(table_bytes, offset + sizeof(uint32_t));
    if (entry.inode == 0) {
      throw Error{ErrorDomain::InvalidFormat, errors::format::kInodeMismatch, "Inode table contains inode 0"};
    }
    if (!table.offsets_.emplace(entry.inode, table.records_start_ + entry.relative_offset).second) {
      throw Error{ErrorDomain::InvalidFormat, errors::format::kInodeMismatch,
                  "Inode table lists inode " + std::to_string(entry.inode) + " twice"};
    }
    table.max_inode_ = std::max(table.max_inode_, entry.inode);
    table.entries_.push_back(entry);
  }
  return table;
}

std::vector<uint8_t> InodeTable::Serialize(std::span<const InodeTableEntry> entries) {
  std::vector<uint8_t> bytes;
  bytes.reserve(entries.size() * kInodeTableEntrySize);
  for (const auto& entry : entries) {
    AppendLE32(bytes, entry.inode);
    AppendLE32(bytes, entry.relative_offset);
  }
  return bytes;
}

std::optional<uint64_t> InodeTable::AbsoluteOffset(uint32_t inode) const {
  auto it = offsets_.find(inode);
  if (it == offsets_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace eclipsefs::core
