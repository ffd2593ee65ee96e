#include "eclipsefs/core/image_writer.h"

#include <algorithm>
#include <limits>

#include "eclipsefs/error.h"
#include "eclipsefs/errors.h"
#include "eclipsefs/storage/backing_store.h"
#include "eclipsefs/tlv/node_codec.h"

namespace eclipsefs::core {

ImageWriter::ImageWriter(uint32_t root_mode) {
  nodes_.emplace(kRootInode, Node::MakeDirectory(root_mode));
}

void ImageWriter::AddNode(uint32_t inode, Node node) {
  if (inode == 0) {
    throw Error{ErrorDomain::InvalidArgument, errors::argument::kDuplicateInode, "Inode 0 is reserved"};
  }
  if (!nodes_.try_emplace(inode, std::move(node)).second) {
    throw Error{ErrorDomain::InvalidArgument, errors::argument::kDuplicateInode,
                "Inode " + std::to_string(inode) + " already added"};
  }
  next_inode_ = std::max(next_inode_, inode + 1);
}

uint32_t ImageWriter::AllocateInode() {
  if (next_inode_ == std::numeric_limits<uint32_t>::max()) {
    throw Error{ErrorDomain::OutOfSpace, errors::space::kInodeIdsExhausted, "Inode numbers exhausted"};
  }
  return next_inode_++;
}

uint32_t ImageWriter::AddChild(uint32_t parent, const std::string& name, Node node) {
  if (name.empty() || name.find('/') != std::string::npos || name == "." || name == "..") {
    throw Error{ErrorDomain::InvalidArgument, errors::argument::kInvalidName, "Invalid entry name '" + name + "'"};
  }
  auto it = nodes_.find(parent);
  if (it == nodes_.end()) {
    throw Error{ErrorDomain::NotFound, errors::lookup::kInodeMissing,
                "Parent inode " + std::to_string(parent) + " not found"};
  }
  if (!it->second.IsDirectory()) {
    throw Error{ErrorDomain::InvalidOperation, errors::operation::kNotADirectory,
                std::string(errors::msg::kNotADirectory)};
  }
  if (it->second.children.count(name) != 0) {
    throw Error{ErrorDomain::InvalidArgument, errors::argument::kDuplicateName,
                "Entry '" + name + "' already exists"};
  }
  const bool is_directory = node.IsDirectory();
  const uint32_t inode = AllocateInode();
  nodes_.emplace(inode, std::move(node));
  auto& parent_node = nodes_.at(parent);
  parent_node.children.emplace(name, inode);
  if (is_directory) {
    ++parent_node.nlink;
  }
  return inode;
}

const Node& ImageWriter::NodeAt(uint32_t inode) const {
  auto it = nodes_.find(inode);
  if (it == nodes_.end()) {
    throw Error{ErrorDomain::NotFound, errors::lookup::kInodeMissing,
                "Inode " + std::to_string(inode) + " not found"};
  }
  return it->second;
}

FsHeader ImageWriter::Finish(storage::BackingStore& store, const FormatOptions& options) const {
  const uint64_t now = options.timestamp != 0 ? options.timestamp : UnixNow();

  std::vector<InodeTableEntry> entries;
  entries.reserve(nodes_.size());
  std::vector<uint8_t> records;
  for (const auto& [inode, source] : nodes_) {
    Node node = source;
    if (node.ctime == 0) {
      node.atime = node.mtime = node.ctime = now;
    }
    if (records.size() > std::numeric_limits<uint32_t>::max()) {
      throw Error{ErrorDomain::OutOfSpace, errors::space::kRecordOffsetOverflow, "Node records exceed 32-bit relative offsets"};
    }
    entries.push_back(InodeTableEntry{inode, static_cast<uint32_t>(records.size())});
    const auto record = tlv::EncodeNodeRecord(inode, node);
    records.insert(records.end(), record.begin(), record.end());
  }

  const auto table = InodeTable::Serialize(entries);

  FsHeader header;
  header.block_size = options.block_size;
  header.total_blocks = options.total_blocks;
  header.free_blocks = options.total_blocks;
  header.inode_table_offset = kHeaderSize;
  header.inode_table_size = table.size();
  header.total_inodes = static_cast<uint32_t>(entries.size());
  header.features = options.features;
  header.timestamp = now;
  SetHeaderLabel(header, options.label);
  header = SealHeader(header);

  // ParseHeader enforces the same block size rules the reader applies.
  const auto header_bytes = SerializeHeader(header);
  (void)ParseHeader(header_bytes);

  store.Write(0, header_bytes);
  store.Write(header.inode_table_offset, table);
  store.Write(header.inode_table_offset + table.size(), records);
  store.Flush();
  return header;
}

}  // namespace eclipsefs::core
