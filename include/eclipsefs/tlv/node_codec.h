#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>

#include "eclipsefs/core/node.h"

namespace eclipsefs::tlv {

namespace tags {
inline constexpr uint16_t kNodeType = 0x0001;
inline constexpr uint16_t kMode = 0x0002;
inline constexpr uint16_t kUid = 0x0003;
inline constexpr uint16_t kGid = 0x0004;
inline constexpr uint16_t kSize = 0x0005;
inline constexpr uint16_t kAtime = 0x0006;
inline constexpr uint16_t kMtime = 0x0007;
inline constexpr uint16_t kCtime = 0x0008;
inline constexpr uint16_t kNlink = 0x0009;
inline constexpr uint16_t kContent = 0x000A;
inline constexpr uint16_t kDirectoryEntries = 0x000B;
inline constexpr uint16_t kVersion = 0x0010;
inline constexpr uint16_t kParentVersion = 0x0011;
inline constexpr uint16_t kSnapshotFlag = 0x0012;
inline constexpr uint16_t kDedupHash = 0x0013;
inline constexpr uint16_t kBlockList = 0x0014;
inline constexpr uint16_t kChecksum = 0x00FF;
}  // namespace tags

// On-disk node record framing: inode:u32, record_size:u32 (including this
// header), followed by the TLV attributes.
inline constexpr std::size_t kNodeRecordHeaderSize = sizeof(uint32_t) * 2;

struct NodeRecordHeader {
  uint32_t inode{0};
  uint32_t record_size{0};
};

std::vector<uint8_t> EncodeDirectoryEntries(const std::map<std::string, uint32_t>& children);

struct DirectoryEntries {
  std::map<std::string, uint32_t> children;
  std::vector<std::string> duplicates; // names seen more than once; first occurrence kept
};

// Throws Error{InvalidFormat} on a truncated blob or an empty name.
DirectoryEntries DecodeDirectoryEntries(std::span<const uint8_t> blob);

// TLV attributes without the trailing checksum record.
std::vector<uint8_t> EncodeNodeBody(const core::Node& node);

// CRC32 of EncodeNodeBody(node). This is the value EncodeNode stores.
uint32_t ComputeNodeChecksum(const core::Node& node);

std::vector<uint8_t> EncodeNode(const core::Node& node);

// Decodes a complete attribute list. Unknown tags are skipped. Any truncated
// or malformed record, unknown node kind, or checksum mismatch throws
// Error{InvalidFormat}; no partially decoded node is ever returned. Duplicate
// directory names are dropped with a warning event.
core::Node DecodeNode(std::span<const uint8_t> tlv, uint32_t inode = 0);

std::vector<uint8_t> EncodeNodeRecord(uint32_t inode, const core::Node& node);
NodeRecordHeader ParseNodeRecordHeader(std::span<const uint8_t> bytes);

}  // namespace eclipsefs::tlv
