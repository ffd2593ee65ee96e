#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "eclipsefs/core/header.h"
#include "eclipsefs/core/node.h"
#include "eclipsefs/encryption/encryption_manager.h"
#include "eclipsefs/meta/dedup_table.h"
#include "eclipsefs/meta/snapshot_table.h"
#include "eclipsefs/orchestrator/engine_config.h"
#include "eclipsefs/storage/backing_store.h"
#include "eclipsefs/storage/block_store.h"
#include "eclipsefs/storage/node_cache.h"
#include "eclipsefs/storage/node_reader.h"

namespace eclipsefs::orchestrator {

struct EngineStats {
  storage::CacheStats cache;
  encryption::EncryptionStats encryption;
  std::size_t inodes{0};
  uint64_t blocks_allocated{0};
  uint64_t free_blocks{0};
  uint64_t bytes_written{0};
  uint64_t bytes_read{0};
  uint64_t dedup_hits{0};
  std::size_t dedup_entries{0};
  std::size_t snapshots{0};
};

// One mounted image. Every public call is serialized on an internal mutex.
class Engine {
public:
  Engine(std::shared_ptr<storage::BackingStore> store, EngineConfig config = {});
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  static std::unique_ptr<Engine> Open(const std::filesystem::path& image, EngineConfig config,
                                      bool read_only = false);

  uint32_t LookupPath(std::string_view path);
  // Path recorded for |inode| by earlier lookups, reads or creates.
  [[nodiscard]] std::optional<std::string> KnownPath(uint32_t inode) const;
  storage::NodePtr ReadNode(uint32_t inode);
  core::NodeStat Stat(uint32_t inode);

  // Bytes in [offset, offset + length) clipped to the file size.
  std::vector<uint8_t> Read(uint32_t inode, uint64_t offset, std::size_t length);
  std::vector<uint8_t> Read(std::string_view path, uint64_t offset, std::size_t length);

  // Copy-on-write: touched chunks go to fresh blocks before the node is
  // republished with a bumped version. Returns the bytes written.
  std::size_t Write(uint32_t inode, uint64_t offset, std::span<const uint8_t> data);
  std::size_t Write(std::string_view path, uint64_t offset, std::span<const uint8_t> data);

  // |mode| 0 picks the default for |kind|.
  uint32_t CreateNode(uint32_t parent, const std::string& name, core::NodeKind kind, uint32_t mode = 0,
                      uint32_t uid = 0, uint32_t gid = 0);

  uint64_t CreateSnapshot(std::string name, std::optional<uint64_t> parent = std::nullopt);

  std::size_t PrefetchDirectory(uint32_t inode);

  // Flushes the store and rewrites the header if the free block count moved.
  void Sync();

  [[nodiscard]] EngineStats Stats() const;
  [[nodiscard]] const core::FsHeader& Header() const noexcept { return header_; }
  [[nodiscard]] const EngineConfig& Config() const noexcept { return config_; }
  [[nodiscard]] std::size_t ChunkSize() const noexcept { return chunk_size_; }

  encryption::EncryptionManager& Encryption() noexcept { return encryption_; }
  meta::DedupTable& Dedup() noexcept { return dedup_; }
  meta::SnapshotTable& Snapshots() noexcept { return snapshots_; }
  storage::BlockStore& Blocks() noexcept { return *blocks_; }

private:
  struct PendingReference {
    meta::ContentHash hash;
    uint64_t block_id;
    uint64_t size;
  };

  uint32_t LookupPathLocked(std::string_view path);
  void RememberChildren(uint32_t inode, const core::Node& node);
  std::vector<uint8_t> ReadLocked(uint32_t inode, uint64_t offset, std::size_t length);
  std::size_t WriteLocked(uint32_t inode, uint64_t offset, std::span<const uint8_t> data);
  std::vector<uint8_t> ReadChunk(const core::Node& node, std::size_t index, const std::string& path);
  std::size_t ChunkLength(uint64_t size, std::size_t index) const noexcept;
  // Walks the tree from the root for inodes not yet reached by a lookup.
  std::string PathFor(uint32_t inode);
  // Domain-separated so cleartext and sealed chunks never collide.
  meta::ContentHash ChunkHash(std::span<const uint8_t> plaintext, encryption::EncryptionType algorithm,
                              uint64_t key_id) const;
  // Dedup reuse also requires the stored block to carry the same framing.
  bool CanShareBlock(uint64_t block_id, encryption::EncryptionType algorithm, uint64_t key_id, std::size_t length);

  EngineConfig config_;
  std::shared_ptr<storage::BackingStore> store_;
  storage::NodeReader reader_;
  core::FsHeader header_;
  std::unique_ptr<storage::BlockStore> blocks_;
  encryption::EncryptionManager encryption_;
  meta::DedupTable dedup_;
  meta::SnapshotTable snapshots_;
  std::size_t chunk_size_{0};
  std::atomic<uint32_t> next_inode_{core::kRootInode + 1};
  std::unordered_map<uint32_t, std::string> paths_;
  uint64_t bytes_written_{0};
  uint64_t bytes_read_{0};
  uint64_t dedup_hits_{0};
  bool dirty_{false};
  mutable std::mutex mutex_;
};

}  // namespace eclipsefs::orchestrator
