#include "eclipsefs/tlv/node_codec.h"
#include "eclipsefs/tlv/parser.h"

#include <cassert>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "eclipsefs/common.h"
#include "eclipsefs/core/checksum.h"
#include "eclipsefs/error.h"
#include "eclipsefs/orchestrator/event_bus.h"

namespace {

namespace tlv = eclipsefs::tlv;
using eclipsefs::core::Node;

void TestParserSplitsRecords() {
  tlv::Writer writer;
  writer.AddU32(0x0102, 0xDEADBEEF).AddU8(0x0003, 7).AddU64(0x0004, 42);
  const auto bytes = writer.Release();
  assert(bytes.size() == 3 * tlv::kRecordHeaderSize + 4 + 1 + 8);

  tlv::Parser parser(bytes);
  assert(parser.valid() && "well formed buffer must parse");
  assert(parser.size() == 3);
  auto it = parser.begin();
  assert(it->type == 0x0102 && it->value.size() == 4 && it->offset == 0);
  ++it;
  assert(it->type == 0x0003 && it->value[0] == 7);
  ++it;
  assert(it->type == 0x0004 && eclipsefs::LoadLE64(it->value, 0) == 42);
}

void TestParserRejectsTruncation() {
  tlv::Writer writer;
  writer.AddU64(0x0001, 1);
  auto bytes = writer.Release();
  bytes.pop_back();
  tlv::Parser short_value(bytes);
  assert(!short_value.valid() && "length running past the buffer must invalidate the parser");

  std::vector<uint8_t> partial_header{0x01, 0x00, 0x02};
  tlv::Parser partial(partial_header);
  assert(!partial.valid() && "partial record header must invalidate the parser");
}

Node SampleDirectory() {
  Node node = Node::MakeDirectory();
  node.uid = 1000;
  node.gid = 100;
  node.atime = 11;
  node.mtime = 22;
  node.ctime = 33;
  node.children = {{"bin", 2}, {"etc", 3}, {"readme.txt", 4}};
  node.nlink = 4;
  return node;
}

void TestNodeRoundTrip() {
  Node dir = SampleDirectory();
  auto encoded = tlv::EncodeNode(dir);
  Node decoded = tlv::DecodeNode(encoded, 1);
  dir.checksum = tlv::ComputeNodeChecksum(dir);
  assert(decoded == dir && "directory must survive encode/decode");

  Node file = Node::MakeFile(std::vector<uint8_t>{'h', 'i'});
  file.version = 7;
  file.parent_version = 6;
  file.is_snapshot = true;
  file.dedup_hash = eclipsefs::core::ContentHash{};
  (*file.dedup_hash)[0] = 0xAB;
  file.blocks = {5, 0, 9};
  Node file_decoded = tlv::DecodeNode(tlv::EncodeNode(file));
  assert(file_decoded.version == 7 && file_decoded.parent_version == 6u);
  assert(file_decoded.is_snapshot && file_decoded.dedup_hash && (*file_decoded.dedup_hash)[0] == 0xAB);
  assert((file_decoded.blocks == std::vector<uint64_t>{5, 0, 9}) && "block list keeps holes");

  Node plain = Node::MakeSymlink("/target");
  Node plain_decoded = tlv::DecodeNode(tlv::EncodeNode(plain));
  assert(!plain_decoded.parent_version && !plain_decoded.dedup_hash && "optional tags stay absent");
  assert(std::string(plain_decoded.data.begin(), plain_decoded.data.end()) == "/target");
}

void TestChecksumMismatchRejected() {
  auto encoded = tlv::EncodeNode(SampleDirectory());
  // Flip one byte of the uid attribute value.
  encoded[tlv::kRecordHeaderSize + 1 + tlv::kRecordHeaderSize + 4 + tlv::kRecordHeaderSize] ^= 0x01;
  bool rejected = false;
  try {
    (void)tlv::DecodeNode(encoded, 9);
  } catch (const eclipsefs::Error& err) {
    rejected = err.domain == eclipsefs::ErrorDomain::InvalidFormat &&
               err.code == eclipsefs::errors::format::kNodeChecksum;
  }
  assert(rejected && "corrupted attribute must fail the node checksum");
}

void TestMalformedInputsRejected() {
  tlv::Writer bad_kind;
  bad_kind.AddU8(tlv::tags::kNodeType, 9);
  bool kind_rejected = false;
  try {
    (void)tlv::DecodeNode(bad_kind.bytes());
  } catch (const eclipsefs::Error& err) {
    kind_rejected = err.domain == eclipsefs::ErrorDomain::InvalidFormat;
  }
  assert(kind_rejected && "unknown node kind is a format error");

  tlv::Writer no_kind;
  no_kind.AddU32(tlv::tags::kMode, 0644);
  bool missing_rejected = false;
  try {
    (void)tlv::DecodeNode(no_kind.bytes());
  } catch (const eclipsefs::Error& err) {
    missing_rejected = err.domain == eclipsefs::ErrorDomain::InvalidFormat;
  }
  assert(missing_rejected && "node without a kind is a format error");

  auto encoded = tlv::EncodeNode(SampleDirectory());
  encoded.resize(encoded.size() - 3);
  bool truncated_rejected = false;
  try {
    (void)tlv::DecodeNode(encoded);
  } catch (const eclipsefs::Error& err) {
    truncated_rejected = err.domain == eclipsefs::ErrorDomain::InvalidFormat;
  }
  assert(truncated_rejected && "truncated record is a format error");

  tlv::Writer wrong_width;
  wrong_width.AddU8(tlv::tags::kNodeType, 1).AddU8(tlv::tags::kUid, 5);
  bool width_rejected = false;
  try {
    (void)tlv::DecodeNode(wrong_width.bytes());
  } catch (const eclipsefs::Error& err) {
    width_rejected = err.domain == eclipsefs::ErrorDomain::InvalidFormat;
  }
  assert(width_rejected && "u32 attribute with one byte is a format error");
}

void TestChecksumTrailerRequired() {
  const auto encoded = tlv::EncodeNode(Node::MakeFile(std::vector<uint8_t>{'h', 'i'}));
  const std::size_t trailer = encoded.size() - tlv::kRecordHeaderSize - sizeof(uint32_t);

  // A flipped tag turns the trailer into an unknown attribute.
  auto bad_tag = encoded;
  bad_tag[trailer] ^= 0x01;
  bad_tag.back() ^= 0x55;
  bool tag_rejected = false;
  try {
    (void)tlv::DecodeNode(bad_tag, 5);
  } catch (const eclipsefs::Error& err) {
    tag_rejected = err.domain == eclipsefs::ErrorDomain::InvalidFormat &&
                   err.code == eclipsefs::errors::format::kNodeChecksum;
  }
  assert(tag_rejected && "node without its checksum trailer must be rejected");

  auto bad_value = encoded;
  bad_value.back() ^= 0x55;
  bool value_rejected = false;
  try {
    (void)tlv::DecodeNode(bad_value, 5);
  } catch (const eclipsefs::Error& err) {
    value_rejected = err.domain == eclipsefs::ErrorDomain::InvalidFormat &&
                     err.code == eclipsefs::errors::format::kNodeChecksum;
  }
  assert(value_rejected && "corrupted checksum value must be rejected");

  tlv::Writer trailing;
  trailing.AddU32(tlv::tags::kMode, 0644);
  const auto extra = trailing.Release();
  auto after_checksum = encoded;
  after_checksum.insert(after_checksum.end(), extra.begin(), extra.end());
  bool order_rejected = false;
  try {
    (void)tlv::DecodeNode(after_checksum, 5);
  } catch (const eclipsefs::Error& err) {
    order_rejected = err.domain == eclipsefs::ErrorDomain::InvalidFormat;
  }
  assert(order_rejected && "checksum must be the final attribute");
}

void TestUnknownTagsSkipped() {
  auto body = tlv::EncodeNodeBody(Node::MakeFile(std::vector<uint8_t>{1, 2, 3}));
  tlv::Writer extra;
  extra.AddU64(0x7ABC, 99);
  const auto extra_bytes = extra.Release();
  body.insert(body.end(), extra_bytes.begin(), extra_bytes.end());
  tlv::Writer checksum;
  checksum.AddU32(tlv::tags::kChecksum, eclipsefs::core::Checksum(body));
  const auto checksum_bytes = checksum.Release();
  body.insert(body.end(), checksum_bytes.begin(), checksum_bytes.end());

  Node decoded = tlv::DecodeNode(body);
  assert(decoded.IsFile() && decoded.data.size() == 3 && "unknown attribute must be ignored");
}

void TestDuplicateDirectoryEntriesKeepFirst() {
  std::vector<std::string> events;
  eclipsefs::orchestrator::EventBus::Instance().Subscribe([&events](const eclipsefs::orchestrator::Event& event) {
    events.push_back(event.event_id);
  });

  std::vector<uint8_t> blob;
  const std::vector<std::pair<std::string, uint32_t>> entries{{"a", 2}, {"b", 3}, {"a", 4}};
  for (const auto& [name, inode] : entries) {
    eclipsefs::AppendLE32(blob, static_cast<uint32_t>(name.size()));
    eclipsefs::AppendLE32(blob, inode);
    blob.insert(blob.end(), name.begin(), name.end());
  }
  tlv::Writer writer;
  writer.AddU8(tlv::tags::kNodeType, static_cast<uint8_t>(eclipsefs::core::NodeKind::Directory))
      .Add(tlv::tags::kDirectoryEntries, blob);
  const uint32_t crc = eclipsefs::core::Checksum(writer.bytes());
  writer.AddU32(tlv::tags::kChecksum, crc);
  Node decoded = tlv::DecodeNode(writer.bytes(), 12);
  assert(decoded.children.size() == 2);
  assert(decoded.children.at("a") == 2 && "first occurrence of a duplicate name wins");

  bool reported = false;
  for (const auto& id : events) {
    reported = reported || id == "directory_duplicate_entry";
  }
  assert(reported && "duplicate entry must be reported");
  eclipsefs::orchestrator::ResetEventBusForTesting();
}

void TestRecordFraming() {
  Node file = Node::MakeFile(std::vector<uint8_t>(10, 0x55));
  auto record = tlv::EncodeNodeRecord(42, file);
  const auto header = tlv::ParseNodeRecordHeader(record);
  assert(header.inode == 42);
  assert(header.record_size == record.size() && "record size includes its own header");
  auto payload = std::span<const uint8_t>(record).subspan(tlv::kNodeRecordHeaderSize);
  assert(tlv::DecodeNode(payload, 42).data.size() == 10);
}

}  // namespace

int main() {
  TestChecksumTrailerRequired();
  TestParserSplitsRecords();
  TestParserRejectsTruncation();
  TestNodeRoundTrip();
  TestChecksumMismatchRejected();
  TestMalformedInputsRejected();
  TestUnknownTagsSkipped();
  TestDuplicateDirectoryEntriesKeepFirst();
  TestRecordFraming();
  std::cout << "tlv codec tests ok\n";
  return 0;
}
