#include "eclipsefs/tlv/node_codec.h"

#include <algorithm>
#include <limits>
#include <string>

#include "eclipsefs/common.h"
#include "eclipsefs/core/checksum.h"
#include "eclipsefs/error.h"
#include "eclipsefs/errors.h"
#include "eclipsefs/orchestrator/event_bus.h"
#include "eclipsefs/tlv/parser.h"

namespace eclipsefs::tlv {

namespace {

[[noreturn]] void ThrowMalformed(std::string_view message, int code = errors::format::kMalformedTlv) {
  throw Error{ErrorDomain::InvalidFormat, code, std::string(message)};
}

void RequireLength(const Record& record, std::size_t expected) {
  if (record.value.size() != expected) {
    ThrowMalformed(errors::msg::kTlvLengthMismatch);
  }
}

uint32_t ReadU32(const Record& record) {
  RequireLength(record, sizeof(uint32_t));
  return LoadLE32(record.value, 0);
}

uint64_t ReadU64(const Record& record) {
  RequireLength(record, sizeof(uint64_t));
  return LoadLE64(record.value, 0);
}

core::NodeKind ParseKind(const Record& record) {
  RequireLength(record, sizeof(uint8_t));
  switch (record.value[0]) {
  case 1:
    return core::NodeKind::File;
  case 2:
    return core::NodeKind::Directory;
  case 3:
    return core::NodeKind::Symlink;
  default:
    ThrowMalformed(errors::msg::kUnknownNodeKind);
  }
}

void ReportDuplicates(uint32_t inode, const std::vector<std::string>& duplicates) {
  for (const auto& name : duplicates) {
    orchestrator::PublishEvent(
        orchestrator::EventCategory::kStorage, orchestrator::EventSeverity::kWarning,
        "directory_duplicate_entry", "Duplicate directory entry dropped during decode",
        {orchestrator::EventField("inode", std::to_string(inode), orchestrator::FieldPrivacy::kPublic, true),
         orchestrator::EventField("name", name, orchestrator::FieldPrivacy::kHash)});
  }
}

}  // namespace

std::vector<uint8_t> EncodeDirectoryEntries(const std::map<std::string, uint32_t>& children) {
  std::vector<uint8_t> blob;
  for (const auto& [name, child] : children) {
    AppendLE32(blob, static_cast<uint32_t>(name.size()));
    AppendLE32(blob, child);
    blob.insert(blob.end(), name.begin(), name.end());
  }
  return blob;
}

DirectoryEntries DecodeDirectoryEntries(std::span<const uint8_t> blob) {
  DirectoryEntries result;
  std::size_t offset = 0;
  while (offset < blob.size()) {
    if (blob.size() - offset < sizeof(uint32_t) * 2) {
      ThrowMalformed(errors::msg::kDirectoryEntriesTruncated);
    }
    const std::size_t name_len = LoadLE32(blob, offset);
    const uint32_t child = LoadLE32(blob, offset + sizeof(uint32_t));
    offset += sizeof(uint32_t) * 2;
    if (blob.size() - offset < name_len) {
      ThrowMalformed(errors::msg::kDirectoryEntriesTruncated);
    }
    if (name_len == 0) {
      ThrowMalformed("Directory entry with empty name");
    }
    std::string name(reinterpret_cast<const char*>(blob.data() + offset), name_len);
    offset += name_len;
    if (!result.children.try_emplace(name, child).second) {
      result.duplicates.push_back(std::move(name));
    }
  }
  return result;
}

std::vector<uint8_t> EncodeNodeBody(const core::Node& node) {
  Writer writer;
  writer.AddU8(tags::kNodeType, static_cast<uint8_t>(node.kind));
  writer.AddU32(tags::kMode, node.mode);
  writer.AddU32(tags::kUid, node.uid);
  writer.AddU32(tags::kGid, node.gid);
  writer.AddU64(tags::kSize, node.size);
  writer.AddU64(tags::kAtime, node.atime);
  writer.AddU64(tags::kMtime, node.mtime);
  writer.AddU64(tags::kCtime, node.ctime);
  writer.AddU32(tags::kNlink, node.nlink);
  if (!node.data.empty()) {
    writer.Add(tags::kContent, node.data);
  }
  if (!node.children.empty()) {
    const auto entries = EncodeDirectoryEntries(node.children);
    writer.Add(tags::kDirectoryEntries, entries);
  }
  writer.AddU64(tags::kVersion, node.version);
  if (node.parent_version) {
    writer.AddU64(tags::kParentVersion, *node.parent_version);
  }
  if (node.is_snapshot) {
    writer.AddU8(tags::kSnapshotFlag, 1);
  }
  if (node.dedup_hash) {
    writer.Add(tags::kDedupHash, *node.dedup_hash);
  }
  if (!node.blocks.empty()) {
    std::vector<uint8_t> list;
    list.reserve(node.blocks.size() * sizeof(uint64_t));
    for (uint64_t block : node.blocks) {
      AppendLE64(list, block);
    }
    writer.Add(tags::kBlockList, list);
  }
  return writer.Release();
}

uint32_t ComputeNodeChecksum(const core::Node& node) {
  return core::Checksum(EncodeNodeBody(node));
}

std::vector<uint8_t> EncodeNode(const core::Node& node) {
  auto body = EncodeNodeBody(node);
  const uint32_t checksum = core::Checksum(body);
  Writer trailer;
  trailer.AddU32(tags::kChecksum, checksum);
  const auto tail = trailer.bytes();
  body.insert(body.end(), tail.begin(), tail.end());
  return body;
}

core::Node DecodeNode(std::span<const uint8_t> tlv, uint32_t inode) {
  Parser parser(tlv);
  if (!parser.valid()) {
    ThrowMalformed(errors::msg::kTlvTruncated, errors::format::kTruncatedRecord);
  }

  core::Node node;
  bool saw_kind = false;
  bool saw_checksum = false;
  std::vector<std::string> duplicates;

  for (const auto& record : parser) {
    if (saw_checksum) {
      ThrowMalformed("Attributes found after node checksum");
    }
    switch (record.type) {
    case tags::kNodeType:
      node.kind = ParseKind(record);
      saw_kind = true;
      break;
    case tags::kMode:
      node.mode = ReadU32(record);
      break;
    case tags::kUid:
      node.uid = ReadU32(record);
      break;
    case tags::kGid:
      node.gid = ReadU32(record);
      break;
    case tags::kSize:
      node.size = ReadU64(record);
      break;
    case tags::kAtime:
      node.atime = ReadU64(record);
      break;
    case tags::kMtime:
      node.mtime = ReadU64(record);
      break;
    case tags::kCtime:
      node.ctime = ReadU64(record);
      break;
    case tags::kNlink:
      node.nlink = ReadU32(record);
      break;
    case tags::kContent:
      node.data.assign(record.value.begin(), record.value.end());
      break;
    case tags::kDirectoryEntries: {
      auto entries = DecodeDirectoryEntries(record.value);
      for (auto& [name, child] : entries.children) {
        if (!node.children.try_emplace(name, child).second) {
          duplicates.push_back(name);
        }
      }
      duplicates.insert(duplicates.end(), entries.duplicates.begin(), entries.duplicates.end());
      break;
    }
    case tags::kVersion:
      node.version = ReadU64(record);
      break;
    case tags::kParentVersion:
      node.parent_version = ReadU64(record);
      break;
    case tags::kSnapshotFlag:
      RequireLength(record, sizeof(uint8_t));
      node.is_snapshot = record.value[0] != 0;
      break;
    case tags::kDedupHash: {
      core::ContentHash hash{};
      RequireLength(record, hash.size());
      std::copy(record.value.begin(), record.value.end(), hash.begin());
      node.dedup_hash = hash;
      break;
    }
    case tags::kBlockList:
      if (record.value.size() % sizeof(uint64_t) != 0) {
        ThrowMalformed(errors::msg::kTlvLengthMismatch);
      }
      node.blocks.clear();
      for (std::size_t off = 0; off < record.value.size(); off += sizeof(uint64_t)) {
        node.blocks.push_back(LoadLE64(record.value, off));
      }
      break;
    case tags::kChecksum: {
      const uint32_t stored = ReadU32(record);
      const uint32_t computed = core::Checksum(tlv.first(record.offset));
      if (stored != computed) {
        ThrowMalformed(errors::msg::kNodeChecksumMismatch, errors::format::kNodeChecksum);
      }
      node.checksum = stored;
      saw_checksum = true;
      break;
    }
    default:
      // Unknown attribute from a newer writer.
      break;
    }
  }

  if (!saw_kind) {
    ThrowMalformed(errors::msg::kMissingNodeKind);
  }
  if (!saw_checksum) {
    ThrowMalformed(errors::msg::kNodeChecksumMissing, errors::format::kNodeChecksum);
  }
  if (!duplicates.empty()) {
    ReportDuplicates(inode, duplicates);
  }
  return node;
}

std::vector<uint8_t> EncodeNodeRecord(uint32_t inode, const core::Node& node) {
  const auto tlv = EncodeNode(node);
  const std::size_t total = kNodeRecordHeaderSize + tlv.size();
  if (total > std::numeric_limits<uint32_t>::max()) {
    throw Error{ErrorDomain::InvalidArgument, errors::argument::kPayloadTooLarge,
                "Node record exceeds 32-bit size"};
  }
  std::vector<uint8_t> record;
  record.reserve(total);
  AppendLE32(record, inode);
  AppendLE32(record, static_cast<uint32_t>(total));
  record.insert(record.end(), tlv.begin(), tlv.end());
  return record;
}

NodeRecordHeader ParseNodeRecordHeader(std::span<const uint8_t> bytes) {
  if (bytes.size() < kNodeRecordHeaderSize) {
    ThrowMalformed(errors::msg::kTlvTruncated, errors::format::kTruncatedRecord);
  }
  NodeRecordHeader header;
  header.inode = LoadLE32(bytes, 0);
  header.record_size = LoadLE32(bytes, sizeof(uint32_t));
  if (header.record_size < kNodeRecordHeaderSize) {
    ThrowMalformed(errors::msg::kNodeRecordTooSmall, errors::format::kTruncatedRecord);
  }
  return header;
}

}  // namespace eclipsefs::tlv
