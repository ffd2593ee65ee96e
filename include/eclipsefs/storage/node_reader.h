#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "eclipsefs/core/header.h"
#include "eclipsefs/core/node.h"
#include "eclipsefs/storage/backing_store.h"
#include "eclipsefs/storage/node_cache.h"

namespace eclipsefs::storage {

// Loads the header and inode table once, then decodes nodes on demand through
// the cache. Nodes committed by the write path during this mount shadow the
// on-disk records. Not internally synchronized beyond the cache's own lock.
class NodeReader {
public:
  NodeReader(std::shared_ptr<BackingStore> store, std::unique_ptr<NodeCache> cache);

  NodeReader(const NodeReader&) = delete;
  NodeReader& operator=(const NodeReader&) = delete;

  NodePtr ReadNode(uint32_t inode);

  // "" and "/" resolve to the root without touching storage.
  uint32_t LookupPath(std::string_view path);

  // Best-effort: warms the cache with a directory's children and returns how
  // many were loaded. Never throws.
  std::size_t PrefetchDirectory(uint32_t inode) noexcept;

  void CommitNode(uint32_t inode, core::Node node);

  [[nodiscard]] bool Exists(uint32_t inode) const;
  [[nodiscard]] uint32_t MaxInode() const noexcept;
  [[nodiscard]] std::size_t InodeCount() const noexcept;
  [[nodiscard]] std::vector<uint32_t> KnownInodes() const;

  [[nodiscard]] const core::FsHeader& header() const noexcept { return header_; }
  [[nodiscard]] const core::InodeTable& inode_table() const noexcept { return table_; }
  [[nodiscard]] NodeCache& cache() noexcept { return *cache_; }
  [[nodiscard]] const NodeCache& cache() const noexcept { return *cache_; }
  [[nodiscard]] BackingStore& store() noexcept { return *store_; }

private:
  NodePtr LoadFromDisk(uint32_t inode);

  std::shared_ptr<BackingStore> store_;
  std::unique_ptr<NodeCache> cache_;
  core::FsHeader header_{};
  core::InodeTable table_{};
  std::unordered_map<uint32_t, NodePtr> committed_;
};

// Splits on '/' and drops empty and "." components.
std::vector<std::string_view> SplitPath(std::string_view path);

}  // namespace eclipsefs::storage
