#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "eclipsefs/core/header.h"
#include "eclipsefs/core/node.h"

namespace eclipsefs::storage {
class BackingStore;
}

namespace eclipsefs::core {

struct FormatOptions {
  uint32_t block_size{kDefaultBlockSize};
  uint64_t total_blocks{kDefaultTotalBlocks};
  uint64_t features{features::kAll};
  uint64_t timestamp{0}; // 0 = now
  std::string label;
};

// Builds a fresh image: header, inode table at offset kHeaderSize, then node
// records in ascending inode order.
class ImageWriter {
public:
  // Starts with a root directory at kRootInode.
  explicit ImageWriter(uint32_t root_mode = kDefaultDirectoryMode);

  // Throws Error{InvalidArgument} if |inode| is 0 or already present.
  void AddNode(uint32_t inode, Node node);
  uint32_t AllocateInode();

  // Allocates an inode for |node| and links it as |name| under |parent|.
  // Subdirectories bump the parent's nlink.
  uint32_t AddChild(uint32_t parent, const std::string& name, Node node);

  [[nodiscard]] const Node& NodeAt(uint32_t inode) const;
  [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }

  // Writes the image and returns the sealed header.
  FsHeader Finish(storage::BackingStore& store, const FormatOptions& options) const;

private:
  std::map<uint32_t, Node> nodes_;
  uint32_t next_inode_{kRootInode + 1};
};

}  // namespace eclipsefs::core
