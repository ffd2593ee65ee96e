#include "eclipsefs/core/header.h"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "eclipsefs/common.h"
#include "eclipsefs/core/image_writer.h"
#include "eclipsefs/error.h"
#include "eclipsefs/storage/backing_store.h"
#include "eclipsefs/tlv/node_codec.h"

namespace {

namespace core = eclipsefs::core;

core::FsHeader SampleHeader() {
  core::FsHeader header;
  header.block_size = 4096;
  header.total_blocks = 128;
  header.free_blocks = 100;
  header.inode_table_size = 3 * core::kInodeTableEntrySize;
  header.total_inodes = 3;
  header.features = core::features::kCopyOnWrite | core::features::kChecksums;
  header.timestamp = 1700000000;
  core::SetHeaderLabel(header, "scratch");
  return core::SealHeader(header);
}

template <typename Fn>
bool ThrowsFormatError(Fn&& fn, int expected_code) {
  try {
    fn();
  } catch (const eclipsefs::Error& err) {
    return err.domain == eclipsefs::ErrorDomain::InvalidFormat && (expected_code == 0 || err.code == expected_code);
  }
  return false;
}

void TestHeaderRoundTrip() {
  const auto header = SampleHeader();
  const auto bytes = core::SerializeHeader(header);
  assert(bytes.size() == core::kHeaderSize);
  assert(core::ValidateHeader(bytes) && "sealed header must validate");
  const auto parsed = core::ParseHeader(bytes);
  assert(parsed == header && "header must survive serialize/parse");
  assert(core::HeaderLabel(parsed) == "scratch");
  assert(eclipsefs::LoadLE32(bytes, core::header_layout::kBlockSize) == 4096 && "fields are little-endian");
  assert(eclipsefs::LoadLE32(bytes, core::header_layout::kTotalInodes) == 3);
}

void TestHeaderRejections() {
  auto bytes = core::SerializeHeader(SampleHeader());

  auto bad_magic = bytes;
  bad_magic[0] = 'X';
  assert(!core::ValidateHeader(bad_magic));
  assert(ThrowsFormatError([&] { (void)core::ParseHeader(bad_magic); }, eclipsefs::errors::format::kBadMagic));

  auto flipped = bytes;
  flipped[core::header_layout::kFreeBlocks] ^= 0x01;
  assert(!core::ValidateHeader(flipped) && "any flipped bit must break the header checksum");
  assert(ThrowsFormatError([&] { (void)core::ParseHeader(flipped); }, eclipsefs::errors::format::kHeaderChecksum));

  auto label_flip = bytes;
  label_flip[core::header_layout::kLabel] ^= 0x20;
  assert(!core::ValidateHeader(label_flip) && "label bytes are covered by the checksum");

  assert(ThrowsFormatError([&] { (void)core::ParseHeader(std::span<const uint8_t>(bytes).first(100)); },
                           eclipsefs::errors::format::kTruncatedRecord));

  auto future = SampleHeader();
  future.version = 0x00030000;
  const auto future_bytes = core::SerializeHeader(core::SealHeader(future));
  assert(ThrowsFormatError([&] { (void)core::ParseHeader(future_bytes); },
                           eclipsefs::errors::format::kUnsupportedVersion));

  auto minor = SampleHeader();
  minor.version = core::kImageVersion + 1;
  (void)core::ParseHeader(core::SerializeHeader(core::SealHeader(minor)));

  auto odd_block = SampleHeader();
  odd_block.block_size = 3000;
  const auto odd_bytes = core::SerializeHeader(core::SealHeader(odd_block));
  assert(ThrowsFormatError([&] { (void)core::ParseHeader(odd_bytes); }, 0));
}

void TestLabelLimits() {
  core::FsHeader header;
  core::SetHeaderLabel(header, std::string(core::kLabelSize - 1, 'x'));
  assert(core::HeaderLabel(header).size() == core::kLabelSize - 1);
  bool rejected = false;
  try {
    core::SetHeaderLabel(header, std::string(core::kLabelSize, 'x'));
  } catch (const eclipsefs::Error& err) {
    rejected = err.domain == eclipsefs::ErrorDomain::InvalidArgument;
  }
  assert(rejected && "label without room for its terminator is rejected");
}

void TestInodeTable() {
  const std::vector<core::InodeTableEntry> entries{{1, 0}, {2, 100}, {7, 180}};
  const auto bytes = core::InodeTable::Serialize(entries);
  assert(bytes.size() == entries.size() * core::kInodeTableEntrySize);

  auto header = SampleHeader();
  const auto table = core::InodeTable::Parse(header, bytes);
  assert(table.size() == 3);
  assert(table.MaxInode() == 7);
  assert(table.RecordsStart() == core::kHeaderSize + bytes.size());
  assert(table.AbsoluteOffset(2) == table.RecordsStart() + 100 && "offsets are relative to the record area");
  assert(!table.AbsoluteOffset(3) && !table.Contains(3));

  assert(ThrowsFormatError([&] { (void)core::InodeTable::Parse(header, std::span<const uint8_t>(bytes).first(16)); },
                           eclipsefs::errors::format::kTruncatedRecord));

  const std::vector<core::InodeTableEntry> duplicate{{1, 0}, {1, 8}, {2, 16}};
  assert(ThrowsFormatError([&] { (void)core::InodeTable::Parse(header, core::InodeTable::Serialize(duplicate)); },
                           eclipsefs::errors::format::kInodeMismatch));
}

void TestImageWriterLayout() {
  core::ImageWriter writer;
  const uint32_t etc = writer.AddChild(core::kRootInode, "etc", core::Node::MakeDirectory());
  const std::vector<uint8_t> content{'o', 'k'};
  const uint32_t file = writer.AddChild(etc, "motd", core::Node::MakeFile(content));
  assert(etc == 2 && file == 3);
  assert(writer.NodeAt(core::kRootInode).nlink == 3 && "subdirectory bumps the parent's link count");

  bool bad_name = false;
  try {
    writer.AddChild(core::kRootInode, "a/b", core::Node::MakeFile({}));
  } catch (const eclipsefs::Error& err) {
    bad_name = err.code == eclipsefs::errors::argument::kInvalidName;
  }
  assert(bad_name && "names with a separator are rejected");

  bool duplicate = false;
  try {
    writer.AddChild(core::kRootInode, "etc", core::Node::MakeFile({}));
  } catch (const eclipsefs::Error& err) {
    duplicate = err.domain == eclipsefs::ErrorDomain::InvalidArgument;
  }
  assert(duplicate && "duplicate names are rejected");

  bool not_dir = false;
  try {
    writer.AddChild(file, "x", core::Node::MakeFile({}));
  } catch (const eclipsefs::Error& err) {
    not_dir = err.domain == eclipsefs::ErrorDomain::InvalidOperation;
  }
  assert(not_dir && "files cannot hold children");

  eclipsefs::storage::MemoryBackingStore store;
  core::FormatOptions options;
  options.block_size = 1024;
  options.total_blocks = 64;
  options.timestamp = 1234;
  options.label = "test";
  const auto header = writer.Finish(store, options);
  assert(header.total_inodes == 3 && header.free_blocks == 64 && header.block_size == 1024);

  const auto parsed = core::ParseHeader(std::span<const uint8_t>(store.bytes()).first(core::kHeaderSize));
  assert(parsed == header);
  const auto table = core::InodeTable::Parse(
      parsed, std::span<const uint8_t>(store.bytes()).subspan(parsed.inode_table_offset, parsed.inode_table_size));
  const auto entries = table.entries();
  assert(entries[0].inode == 1 && entries[1].inode == 2 && entries[2].inode == 3 && "records in inode order");
  assert(entries[0].relative_offset == 0);

  const auto offset = *table.AbsoluteOffset(file);
  const auto record_header =
      eclipsefs::tlv::ParseNodeRecordHeader(std::span<const uint8_t>(store.bytes()).subspan(offset));
  assert(record_header.inode == file);
  const auto node = eclipsefs::tlv::DecodeNode(std::span<const uint8_t>(store.bytes())
                                                   .subspan(offset + eclipsefs::tlv::kNodeRecordHeaderSize,
                                                            record_header.record_size -
                                                                eclipsefs::tlv::kNodeRecordHeaderSize));
  assert(node.data == content);
}

}  // namespace

int main() {
  TestHeaderRoundTrip();
  TestHeaderRejections();
  TestLabelLimits();
  TestInodeTable();
  TestImageWriterLayout();
  std::cout << "header tests ok\n";
  return 0;
}
