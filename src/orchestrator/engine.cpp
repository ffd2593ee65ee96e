#include "eclipsefs/orchestrator/engine.h"

#include <algorithm>
#include <array>
#include <deque>
#include <limits>
#include <set>

#include "eclipsefs/common.h"
#include "eclipsefs/crypto/aead.h"
#include "eclipsefs/crypto/sha256.h"
#include "eclipsefs/error.h"
#include "eclipsefs/errors.h"
#include "eclipsefs/orchestrator/event_bus.h"
#include "eclipsefs/storage/compression.h"
#include "eclipsefs/tlv/node_codec.h"

namespace eclipsefs::orchestrator {

namespace {

// Worst-case AEAD framing (XChaCha20 nonce plus tag) so every chunk fits a
// block whatever the path's algorithm.
constexpr std::size_t kMaxEncryptionOverhead =
    crypto::ParametersFor(crypto::AeadAlgorithm::kXChaCha20Poly1305).nonce_size + crypto::kAeadTagSize;

EngineConfig Validated(EngineConfig config) {
  config.Validate();
  return config;
}

std::string JoinPath(std::string_view parent, std::string_view name) {
  std::string path(parent == "/" ? "" : parent);
  path.push_back('/');
  path.append(name);
  return path;
}

void ValidateEntryName(const std::string& name) {
  if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos ||
      name.find('\0') != std::string::npos) {
    throw Error{ErrorDomain::InvalidArgument, errors::argument::kInvalidName, "Invalid entry name '" + name + "'"};
  }
}

// Version bump shared by every metadata change.
void Supersede(core::Node& node, uint64_t now) {
  node.parent_version = node.version;
  ++node.version;
  node.mtime = now;
  node.ctime = now;
}

}  // namespace

Engine::Engine(std::shared_ptr<storage::BackingStore> store, EngineConfig config)
    : config_(Validated(std::move(config))),
      store_(std::move(store)),
      reader_(store_, storage::MakeNodeCache(config_.cache_strategy, config_.cache_capacity)),
      header_(reader_.header()),
      blocks_(std::make_unique<storage::BlockStore>(*store_, header_.block_size,
                                                    storage::AlignUp(store_->Size(), header_.block_size),
                                                    header_.free_blocks)),
      encryption_(config_.default_encryption, config_.rotation_threshold, config_.key_grace_period) {
  for (const auto& policy : config_.policies) {
    encryption_.AddPolicy(policy.prefix, policy.algorithm);
  }
  if (blocks_->PayloadCapacity() <= kMaxEncryptionOverhead) {
    throw Error{ErrorDomain::InvalidArgument, errors::argument::kBadBlockSize,
                "Block size " + std::to_string(header_.block_size) + " too small for encrypted chunks"};
  }
  chunk_size_ = blocks_->PayloadCapacity() - kMaxEncryptionOverhead;
  next_inode_.store(reader_.MaxInode() + 1, std::memory_order_relaxed);
  paths_[core::kRootInode] = "/";

  PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "engine_mounted", "EclipseFS image mounted",
               {EventField("inodes", std::to_string(reader_.InodeCount()), FieldPrivacy::kPublic, true),
                EventField("block_size", std::to_string(header_.block_size), FieldPrivacy::kPublic, true),
                EventField("cache", reader_.cache().Name())});
}

Engine::~Engine() {
  try {
    Sync();
  } catch (const std::exception& ex) {
    PublishEvent(EventCategory::kDiagnostics, EventSeverity::kError, "engine_sync_failed",
                 std::string("Final sync failed: ") + ex.what());
  }
  PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "engine_unmounted", "EclipseFS image unmounted");
}

std::unique_ptr<Engine> Engine::Open(const std::filesystem::path& image, EngineConfig config, bool read_only) {
  auto store = std::make_shared<storage::FileBackingStore>(
      image, read_only ? storage::FileBackingStore::Mode::kReadOnly : storage::FileBackingStore::Mode::kReadWrite);
  return std::make_unique<Engine>(std::move(store), std::move(config));
}

uint32_t Engine::LookupPath(std::string_view path) {
  std::lock_guard<std::mutex> lock(mutex_);
  return LookupPathLocked(path);
}

uint32_t Engine::LookupPathLocked(std::string_view path) {
  const uint32_t inode = reader_.LookupPath(path);
  // Every directory on the way is cached by now; record the prefixes too.
  uint32_t current = core::kRootInode;
  std::string prefix = "/";
  for (auto component : storage::SplitPath(path)) {
    auto node = reader_.ReadNode(current);
    current = node->children.at(std::string(component));
    prefix = JoinPath(prefix, component);
    paths_.try_emplace(current, prefix);
  }
  RememberChildren(inode, *reader_.ReadNode(inode));
  return inode;
}

void Engine::RememberChildren(uint32_t inode, const core::Node& node) {
  if (!node.IsDirectory()) {
    return;
  }
  auto it = paths_.find(inode);
  if (it == paths_.end()) {
    return;
  }
  const std::string base = it->second;
  for (const auto& [name, child] : node.children) {
    paths_.try_emplace(child, JoinPath(base, name));
  }
}

storage::NodePtr Engine::ReadNode(uint32_t inode) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto node = reader_.ReadNode(inode);
  RememberChildren(inode, *node);
  return node;
}

std::optional<std::string> Engine::KnownPath(uint32_t inode) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = paths_.find(inode); it != paths_.end()) {
    return it->second;
  }
  return std::nullopt;
}

core::NodeStat Engine::Stat(uint32_t inode) {
  std::lock_guard<std::mutex> lock(mutex_);
  return core::MakeStat(inode, *reader_.ReadNode(inode));
}

std::string Engine::PathFor(uint32_t inode) {
  if (auto it = paths_.find(inode); it != paths_.end()) {
    return it->second;
  }
  // Fallback for inodes no lookup has reached yet. Each directory visited
  // records its children, so a later call for any of them is a map hit.
  std::deque<uint32_t> pending{core::kRootInode};
  std::set<uint32_t> visited;
  while (!pending.empty()) {
    const uint32_t dir = pending.front();
    pending.pop_front();
    if (!visited.insert(dir).second) {
      continue;
    }
    auto node = reader_.ReadNode(dir);
    if (!node->IsDirectory()) {
      continue;
    }
    RememberChildren(dir, *node);
    if (auto it = paths_.find(inode); it != paths_.end()) {
      return it->second;
    }
    for (const auto& entry : node->children) {
      pending.push_back(entry.second);
    }
  }
  return std::string();
}

std::size_t Engine::ChunkLength(uint64_t size, std::size_t index) const noexcept {
  const uint64_t start = static_cast<uint64_t>(index) * chunk_size_;
  if (start >= size) {
    return 0;
  }
  return static_cast<std::size_t>(std::min<uint64_t>(chunk_size_, size - start));
}

meta::ContentHash Engine::ChunkHash(std::span<const uint8_t> plaintext, encryption::EncryptionType algorithm,
                                    uint64_t key_id) const {
  if (algorithm == encryption::EncryptionType::kNone) {
    return crypto::SHA256_Domain("eclipsefs.chunk.plain", {plaintext});
  }
  const std::array<uint8_t, 1> tag{static_cast<uint8_t>(algorithm)};
  const auto key = EncodeLE<8>(key_id);
  return crypto::SHA256_Domain("eclipsefs.chunk.sealed", {tag, key, plaintext});
}

bool Engine::CanShareBlock(uint64_t block_id, encryption::EncryptionType algorithm, uint64_t key_id,
                           std::size_t length) {
  const auto record = blocks_->ReadBlock(block_id);
  return record.header.encryption == static_cast<uint8_t>(algorithm) && record.header.key_id == key_id &&
         record.header.original_size == length;
}

std::vector<uint8_t> Engine::ReadChunk(const core::Node& node, std::size_t index, const std::string& path) {
  const std::size_t length = ChunkLength(node.size, index);
  std::vector<uint8_t> chunk;
  if (node.blocks.empty()) {
    const std::size_t start = index * chunk_size_;
    if (start < node.data.size()) {
      const std::size_t end = std::min(node.data.size(), start + length);
      chunk.assign(node.data.begin() + static_cast<std::ptrdiff_t>(start),
                   node.data.begin() + static_cast<std::ptrdiff_t>(end));
    }
    chunk.resize(length, 0);
    return chunk;
  }
  if (index >= node.blocks.size() || node.blocks[index] == 0) {
    chunk.resize(length, 0);
    return chunk;
  }

  auto record = blocks_->ReadBlock(node.blocks[index]);
  std::vector<uint8_t> payload = std::move(record.payload);
  if (record.header.encryption != static_cast<uint8_t>(encryption::EncryptionType::kNone)) {
    payload = encryption_.Decrypt(payload, record.header.key_id, path);
  }
  switch (static_cast<storage::CompressionType>(record.header.compression)) {
    case storage::CompressionType::kNone:
      break;
    case storage::CompressionType::kZstd:
      payload = storage::ZstdDecompress(payload, record.header.original_size);
      break;
    default:
      throw Error{ErrorDomain::InvalidOperation, errors::operation::kUnsupportedCompression,
                  "Unsupported block compression " + std::to_string(record.header.compression)};
  }
  if (payload.size() != record.header.original_size) {
    throw Error{ErrorDomain::InvalidFormat, errors::format::kBlockChecksum,
                "Block " + std::to_string(node.blocks[index]) + " payload size does not match its header"};
  }
  payload.resize(length, 0);
  return payload;
}

std::vector<uint8_t> Engine::Read(uint32_t inode, uint64_t offset, std::size_t length) {
  std::lock_guard<std::mutex> lock(mutex_);
  return ReadLocked(inode, offset, length);
}

std::vector<uint8_t> Engine::Read(std::string_view path, uint64_t offset, std::size_t length) {
  std::lock_guard<std::mutex> lock(mutex_);
  return ReadLocked(LookupPathLocked(path), offset, length);
}

std::vector<uint8_t> Engine::ReadLocked(uint32_t inode, uint64_t offset, std::size_t length) {
  auto node = reader_.ReadNode(inode);
  if (node->IsDirectory()) {
    throw Error{ErrorDomain::InvalidOperation, errors::operation::kIsADirectory,
                "Cannot read file data from a directory"};
  }
  std::vector<uint8_t> out;
  if (offset >= node->size || length == 0) {
    return out;
  }
  const uint64_t end = std::min<uint64_t>(node->size, offset + length);
  out.reserve(static_cast<std::size_t>(end - offset));

  const std::string path = PathFor(inode);
  const std::size_t first = static_cast<std::size_t>(offset / chunk_size_);
  const std::size_t last = static_cast<std::size_t>((end - 1) / chunk_size_);
  for (std::size_t index = first; index <= last; ++index) {
    const auto chunk = ReadChunk(*node, index, path);
    const uint64_t chunk_start = static_cast<uint64_t>(index) * chunk_size_;
    const uint64_t from = std::max(offset, chunk_start) - chunk_start;
    const uint64_t to = std::min<uint64_t>(end, chunk_start + chunk.size()) - chunk_start;
    out.insert(out.end(), chunk.begin() + static_cast<std::ptrdiff_t>(from),
               chunk.begin() + static_cast<std::ptrdiff_t>(to));
  }
  bytes_read_ += out.size();
  return out;
}

std::size_t Engine::Write(uint32_t inode, uint64_t offset, std::span<const uint8_t> data) {
  std::lock_guard<std::mutex> lock(mutex_);
  return WriteLocked(inode, offset, data);
}

std::size_t Engine::Write(std::string_view path, uint64_t offset, std::span<const uint8_t> data) {
  std::lock_guard<std::mutex> lock(mutex_);
  return WriteLocked(LookupPathLocked(path), offset, data);
}

std::size_t Engine::WriteLocked(uint32_t inode, uint64_t offset, std::span<const uint8_t> data) {
  auto old_node = reader_.ReadNode(inode);
  if (old_node->IsDirectory()) {
    throw Error{ErrorDomain::InvalidOperation, errors::operation::kIsADirectory,
                std::string(errors::msg::kIsADirectory)};
  }
  if (data.empty()) {
    return 0;
  }
  if (offset > std::numeric_limits<uint32_t>::max() ||
      data.size() > std::numeric_limits<uint32_t>::max() - offset) {
    throw Error{ErrorDomain::InvalidArgument, errors::argument::kPayloadTooLarge,
                "Write extends past the 4 GiB per-file limit"};
  }

  const std::string path = PathFor(inode);
  const auto config = encryption_.GetConfigForPath(path);
  const bool encrypted = config.algorithm != encryption::EncryptionType::kNone;
  const uint64_t key_id = encrypted ? encryption_.ActiveKeyFor(config.algorithm) : 0;

  const uint64_t write_end = offset + data.size();
  const uint64_t new_size = std::max(old_node->size, write_end);
  const std::size_t chunk_count = static_cast<std::size_t>((new_size + chunk_size_ - 1) / chunk_size_);
  const std::size_t first = static_cast<std::size_t>(offset / chunk_size_);
  const std::size_t last = static_cast<std::size_t>((write_end - 1) / chunk_size_);
  const bool inline_content = old_node->blocks.empty();
  const std::size_t old_chunks = static_cast<std::size_t>((old_node->size + chunk_size_ - 1) / chunk_size_);

  std::set<std::size_t> rewrite;
  for (std::size_t index = first; index <= last; ++index) {
    rewrite.insert(index);
  }
  if (inline_content) {
    for (std::size_t index = 0; index < old_chunks; ++index) {
      rewrite.insert(index);
    }
  }

  std::vector<uint64_t> new_blocks(old_node->blocks);
  new_blocks.resize(chunk_count, 0);
  std::vector<uint64_t> superseded;
  std::vector<PendingReference> references;
  std::unordered_map<std::size_t, std::vector<uint8_t>> plaintexts;
  const uint64_t now = core::UnixNow();

  // Persist every touched chunk before any metadata changes.
  for (std::size_t index : rewrite) {
    auto plaintext = ReadChunk(*old_node, index, path);
    const std::size_t length = ChunkLength(new_size, index);
    plaintext.resize(length, 0);
    const uint64_t chunk_start = static_cast<uint64_t>(index) * chunk_size_;
    const uint64_t copy_from = std::max(offset, chunk_start);
    const uint64_t copy_to = std::min<uint64_t>(write_end, chunk_start + length);
    if (copy_from < copy_to) {
      std::copy(data.begin() + static_cast<std::ptrdiff_t>(copy_from - offset),
                data.begin() + static_cast<std::ptrdiff_t>(copy_to - offset),
                plaintext.begin() + static_cast<std::ptrdiff_t>(copy_from - chunk_start));
    }

    const uint64_t previous_id = index < old_node->blocks.size() ? old_node->blocks[index] : 0;
    std::optional<meta::ContentHash> hash;
    uint64_t block_id = 0;
    if (config_.enable_dedup) {
      hash = ChunkHash(plaintext, config.algorithm, key_id);
      if (auto existing = dedup_.Lookup(*hash)) {
        if (CanShareBlock(existing->block_id, config.algorithm, key_id, length)) {
          block_id = existing->block_id;
          ++dedup_hits_;
        } else {
          // The entry keeps its block; this chunk is stored without sharing.
          hash.reset();
        }
      } else {
        auto pending = std::find_if(references.begin(), references.end(),
                                    [&](const PendingReference& ref) { return ref.hash == *hash; });
        if (pending != references.end()) {
          block_id = pending->block_id;
          ++dedup_hits_;
        }
      }
    }

    if (block_id == 0) {
      std::vector<uint8_t> payload;
      storage::CompressionType compression = storage::CompressionType::kNone;
      if (config_.compression == storage::CompressionType::kZstd) {
        if (auto compressed = storage::ZstdCompressIfSmaller(plaintext, config_.zstd_level)) {
          payload = std::move(*compressed);
          compression = storage::CompressionType::kZstd;
        }
      }
      if (compression == storage::CompressionType::kNone) {
        payload = plaintext;
      }
      if (encrypted) {
        payload = encryption_.Encrypt(payload, key_id, path);
      }

      storage::BlockHeader block_header;
      block_header.inode = inode;
      block_header.offset = static_cast<uint32_t>(chunk_start);
      block_header.original_size = static_cast<uint32_t>(length);
      block_header.compression = static_cast<uint8_t>(compression);
      block_header.encryption = static_cast<uint8_t>(config.algorithm);
      block_header.key_id = key_id;
      block_header.timestamp = now;
      block_id = blocks_->WriteBlockCow(previous_id, block_header, payload);
      dirty_ = true;
    }

    if (hash) {
      references.push_back(PendingReference{*hash, block_id, length});
    }
    if (previous_id != 0) {
      superseded.push_back(previous_id);
    }
    new_blocks[index] = block_id;
    plaintexts.emplace(index, std::move(plaintext));
  }

  // Blocks are durable; publish references and the new node version.
  if (config_.enable_dedup) {
    for (const auto& ref : references) {
      dedup_.AddReference(ref.hash, ref.block_id, ref.size);
    }
    for (uint64_t block_id : superseded) {
      auto hash = dedup_.HashForBlock(block_id);
      if (!hash) {
        continue;
      }
      if (auto info = dedup_.Lookup(*hash); info && info->block_id == block_id) {
        dedup_.Release(*hash);
      }
    }
  }

  core::Node node = *old_node;
  std::vector<uint8_t> content;
  content.reserve(static_cast<std::size_t>(new_size));
  for (std::size_t index = 0; index < chunk_count; ++index) {
    if (auto it = plaintexts.find(index); it != plaintexts.end()) {
      content.insert(content.end(), it->second.begin(), it->second.end());
    } else {
      auto chunk = ReadChunk(*old_node, index, path);
      chunk.resize(ChunkLength(new_size, index), 0);
      content.insert(content.end(), chunk.begin(), chunk.end());
    }
  }
  node.data.clear();
  node.blocks = std::move(new_blocks);
  node.size = new_size;
  node.dedup_hash = crypto::SHA256_Hash(content);
  Supersede(node, now);
  node.checksum = tlv::ComputeNodeChecksum(node);
  reader_.CommitNode(inode, std::move(node));

  bytes_written_ += data.size();
  return data.size();
}

uint32_t Engine::CreateNode(uint32_t parent, const std::string& name, core::NodeKind kind, uint32_t mode,
                            uint32_t uid, uint32_t gid) {
  ValidateEntryName(name);
  std::lock_guard<std::mutex> lock(mutex_);
  auto parent_node = reader_.ReadNode(parent);
  if (!parent_node->IsDirectory()) {
    throw Error{ErrorDomain::InvalidOperation, errors::operation::kNotADirectory,
                std::string(errors::msg::kNotADirectory)};
  }
  if (parent_node->children.count(name) != 0) {
    throw Error{ErrorDomain::InvalidArgument, errors::argument::kDuplicateName,
                "Entry '" + name + "' already exists"};
  }

  core::Node node;
  switch (kind) {
    case core::NodeKind::Directory:
      node = core::Node::MakeDirectory();
      break;
    case core::NodeKind::File:
      node = core::Node::MakeFile({});
      break;
    case core::NodeKind::Symlink:
      node = core::Node::MakeSymlink({});
      break;
  }
  if (mode != 0) {
    node.mode = mode;
  }
  node.uid = uid;
  node.gid = gid;
  const uint64_t now = core::UnixNow();
  node.atime = node.mtime = node.ctime = now;

  uint32_t inode = next_inode_.fetch_add(1, std::memory_order_relaxed);
  if (inode == 0) {
    throw Error{ErrorDomain::OutOfSpace, errors::space::kInodeIdsExhausted, "Inode numbers exhausted"};
  }
  node.checksum = tlv::ComputeNodeChecksum(node);

  core::Node updated_parent = *parent_node;
  updated_parent.children.emplace(name, inode);
  if (kind == core::NodeKind::Directory) {
    ++updated_parent.nlink;
  }
  Supersede(updated_parent, now);
  updated_parent.checksum = tlv::ComputeNodeChecksum(updated_parent);

  reader_.CommitNode(inode, std::move(node));
  reader_.CommitNode(parent, std::move(updated_parent));
  if (auto it = paths_.find(parent); it != paths_.end()) {
    paths_[inode] = JoinPath(it->second, name);
  }
  return inode;
}

uint64_t Engine::CreateSnapshot(std::string name, std::optional<uint64_t> parent) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string label = name;
  const uint64_t id = snapshots_.Create(std::move(name), parent, reader_.InodeCount(), blocks_->AllocatedCount(),
                                        core::UnixNow());
  PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "snapshot_created", "Snapshot created",
               {EventField("snapshot_id", std::to_string(id), FieldPrivacy::kPublic, true),
                EventField("name", label, FieldPrivacy::kHash)});
  return id;
}

std::size_t Engine::PrefetchDirectory(uint32_t inode) {
  std::lock_guard<std::mutex> lock(mutex_);
  return reader_.PrefetchDirectory(inode);
}

void Engine::Sync() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!dirty_) {
    return;
  }
  store_->Flush();
  if (header_.free_blocks != blocks_->FreeBlocks()) {
    header_.free_blocks = blocks_->FreeBlocks();
    header_ = core::SealHeader(header_);
    store_->Write(0, core::SerializeHeader(header_));
    store_->Flush();
  }
  dirty_ = false;
}

EngineStats Engine::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  EngineStats stats;
  stats.cache = reader_.cache().Stats();
  stats.encryption = encryption_.Stats();
  stats.inodes = reader_.InodeCount();
  stats.blocks_allocated = blocks_->AllocatedCount();
  stats.free_blocks = blocks_->FreeBlocks();
  stats.bytes_written = bytes_written_;
  stats.bytes_read = bytes_read_;
  stats.dedup_hits = dedup_hits_;
  stats.dedup_entries = dedup_.size();
  stats.snapshots = snapshots_.size();
  return stats;
}

}  // namespace eclipsefs::orchestrator
