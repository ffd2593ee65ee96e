#include "eclipsefs/orchestrator/engine.h"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "eclipsefs/common.h"
#include "eclipsefs/core/header.h"
#include "eclipsefs/core/image_writer.h"
#include "eclipsefs/crypto/sha256.h"
#include "eclipsefs/error.h"
#include "eclipsefs/storage/backing_store.h"

namespace {

namespace core = eclipsefs::core;
namespace orchestrator = eclipsefs::orchestrator;
namespace storage = eclipsefs::storage;
using eclipsefs::encryption::EncryptionType;

constexpr uint32_t kSmallBlocks = 512;

struct Fixture {
  std::shared_ptr<storage::MemoryBackingStore> store;
  uint32_t home{0};
  uint32_t etc{0};
  uint32_t tmp{0};
  uint32_t notes{0};
  uint32_t app_conf{0};
};

std::vector<uint8_t> Bytes(const std::string& text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

std::vector<uint8_t> Pattern(std::size_t length, uint8_t seed) {
  std::vector<uint8_t> data(length);
  for (std::size_t i = 0; i < length; ++i) {
    data[i] = static_cast<uint8_t>(seed + i * 13 + (i >> 5));
  }
  return data;
}

Fixture Format(uint64_t total_blocks = 1024) {
  Fixture fx;
  core::ImageWriter writer;
  fx.home = writer.AddChild(core::kRootInode, "home", core::Node::MakeDirectory());
  fx.etc = writer.AddChild(core::kRootInode, "etc", core::Node::MakeDirectory());
  fx.tmp = writer.AddChild(core::kRootInode, "tmp", core::Node::MakeDirectory());
  fx.notes = writer.AddChild(fx.home, "notes.txt", core::Node::MakeFile(Bytes("hello")));
  const uint32_t app = writer.AddChild(fx.etc, "app", core::Node::MakeDirectory());
  fx.app_conf = writer.AddChild(app, "conf", core::Node::MakeFile(Bytes("k=v\n")));
  fx.store = std::make_shared<storage::MemoryBackingStore>();
  core::FormatOptions options;
  options.block_size = kSmallBlocks;
  options.total_blocks = total_blocks;
  options.label = "engine-test";
  writer.Finish(*fx.store, options);
  return fx;
}

std::unique_ptr<orchestrator::Engine> Mount(const Fixture& fx, orchestrator::EngineConfig config = {}) {
  return std::make_unique<orchestrator::Engine>(fx.store, std::move(config));
}

template <typename Fn>
bool ThrowsWith(Fn&& fn, eclipsefs::ErrorDomain domain, int code) {
  try {
    fn();
  } catch (const eclipsefs::Error& err) {
    return err.domain == domain && err.code == code;
  }
  return false;
}

void TestInlineReads() {
  auto fx = Format();
  auto engine = Mount(fx);
  assert(engine->ChunkSize() == kSmallBlocks - storage::kBlockOverhead - 40);
  assert(core::HeaderLabel(engine->Header()) == "engine-test");
  assert(engine->LookupPath("/home/notes.txt") == fx.notes);
  assert(engine->Read("/home/notes.txt", 0, 100) == Bytes("hello"));
  assert(engine->Read(fx.notes, 1, 3) == Bytes("ell"));
  assert(engine->Read(fx.notes, 5, 10).empty() && "reads at EOF are empty");

  const auto stat = engine->Stat(fx.notes);
  assert(stat.inode == fx.notes && stat.size == 5 && stat.nlink == 1 && stat.version == 1);
  assert(stat.mode == core::kDefaultFileMode);

  assert(ThrowsWith([&] { (void)engine->Read(fx.home, 0, 1); }, eclipsefs::ErrorDomain::InvalidOperation,
                    eclipsefs::errors::operation::kIsADirectory));
  assert(ThrowsWith([&] { (void)engine->Read("/home/missing", 0, 1); }, eclipsefs::ErrorDomain::NotFound,
                    eclipsefs::errors::lookup::kPathComponentMissing));
}

void TestCreateNode() {
  auto fx = Format();
  auto engine = Mount(fx);
  const auto tmp_before = engine->Stat(fx.tmp);
  const uint32_t dir = engine->CreateNode(fx.tmp, "build", core::NodeKind::Directory);
  assert(dir == fx.app_conf + 1 && "new inodes start above the highest mounted inode");
  const uint32_t file = engine->CreateNode(dir, "out.bin", core::NodeKind::File, 0100600, 1000, 1000);
  const uint32_t link = engine->CreateNode(dir, "latest", core::NodeKind::Symlink);
  assert(file == dir + 1 && link == dir + 2);

  const auto tmp_after = engine->Stat(fx.tmp);
  assert(tmp_after.nlink == tmp_before.nlink + 1 && "subdirectory bumps the parent link count");
  assert(tmp_after.version == tmp_before.version + 1);
  assert(engine->ReadNode(fx.tmp)->parent_version == tmp_before.version);

  const auto file_stat = engine->Stat(file);
  assert(file_stat.mode == 0100600 && file_stat.uid == 1000 && file_stat.gid == 1000 && file_stat.size == 0);
  assert(engine->Stat(dir).mode == core::kDefaultDirectoryMode && engine->Stat(dir).nlink == 2);
  assert(engine->ReadNode(link)->IsSymlink());
  assert(engine->LookupPath("/tmp/build/out.bin") == file);

  assert(ThrowsWith([&] { (void)engine->CreateNode(dir, "out.bin", core::NodeKind::File); },
                    eclipsefs::ErrorDomain::InvalidArgument, eclipsefs::errors::argument::kDuplicateName));
  assert(ThrowsWith([&] { (void)engine->CreateNode(dir, "..", core::NodeKind::File); },
                    eclipsefs::ErrorDomain::InvalidArgument, eclipsefs::errors::argument::kInvalidName));
  assert(ThrowsWith([&] { (void)engine->CreateNode(dir, "a/b", core::NodeKind::File); },
                    eclipsefs::ErrorDomain::InvalidArgument, eclipsefs::errors::argument::kInvalidName));
  assert(ThrowsWith([&] { (void)engine->CreateNode(file, "child", core::NodeKind::File); },
                    eclipsefs::ErrorDomain::InvalidOperation, eclipsefs::errors::operation::kNotADirectory));
  assert(engine->Stats().inodes == 10);
}

void TestCopyOnWriteAcrossChunks() {
  auto fx = Format();
  auto engine = Mount(fx);
  const uint32_t file = engine->CreateNode(fx.tmp, "data", core::NodeKind::File);
  const std::size_t chunk = engine->ChunkSize();

  auto content = Pattern(chunk * 2 + 100, 1);
  assert(engine->Write(file, 0, content) == content.size());
  assert(engine->Read("/tmp/data", 0, content.size()) == content);
  auto node = engine->ReadNode(file);
  assert(node->blocks.size() == 3 && node->data.empty());
  assert(node->version == 2 && node->parent_version == 1);
  assert(node->dedup_hash == eclipsefs::crypto::SHA256_Hash(content));
  assert(engine->Stats().blocks_allocated == 3);

  const auto original_blocks = node->blocks;
  const auto patch = Bytes("PATCHED");
  (void)engine->Write(file, chunk + 10, patch);
  std::copy(patch.begin(), patch.end(), content.begin() + static_cast<std::ptrdiff_t>(chunk + 10));
  assert(engine->Read(file, 0, content.size()) == content);

  node = engine->ReadNode(file);
  assert(node->version == 3 && node->parent_version == 2);
  assert(node->blocks[0] == original_blocks[0] && node->blocks[2] == original_blocks[2] &&
         "untouched chunks keep their blocks");
  assert(node->blocks[1] != original_blocks[1]);
  assert(engine->Blocks().SuccessorOf(original_blocks[1]) == node->blocks[1]);
  assert(engine->Blocks().IsWritten(original_blocks[1]) && "superseded block stays readable");
  assert(engine->Stats().blocks_allocated == 4);

  const auto tail = Pattern(50, 9);
  (void)engine->Write(file, content.size(), tail);
  content.insert(content.end(), tail.begin(), tail.end());
  assert(engine->Stat(file).size == content.size());
  assert(engine->Read(file, content.size() - 60, 60) ==
         std::vector<uint8_t>(content.end() - 60, content.end()));
  assert(engine->Stats().bytes_written == chunk * 2 + 100 + patch.size() + tail.size());
}

void TestSparseWrite() {
  auto fx = Format();
  auto engine = Mount(fx);
  const uint32_t file = engine->CreateNode(fx.tmp, "sparse", core::NodeKind::File);
  const std::size_t chunk = engine->ChunkSize();
  const uint64_t offset = chunk * 4 + 5;
  (void)engine->Write(file, offset, Bytes("tail"));

  const auto node = engine->ReadNode(file);
  assert(node->size == offset + 4);
  assert(node->blocks.size() == 5 && node->blocks[0] == 0 && node->blocks[3] == 0 && node->blocks[4] != 0);
  assert(engine->Stats().blocks_allocated == 1 && "holes consume no blocks");
  const auto head = engine->Read(file, 0, static_cast<std::size_t>(offset));
  assert(head.size() == offset && std::all_of(head.begin(), head.end(), [](uint8_t b) { return b == 0; }));
  assert(engine->Read(file, offset, 10) == Bytes("tail"));
}

void TestInlineFilePromotedToBlocks() {
  auto fx = Format();
  auto engine = Mount(fx);
  (void)engine->Write("/home/notes.txt", 5, Bytes(" world"));
  assert(engine->Read(fx.notes, 0, 64) == Bytes("hello world"));
  const auto node = engine->ReadNode(fx.notes);
  assert(node->data.empty() && node->blocks.size() == 1);
  const auto record = engine->Blocks().ReadBlock(node->blocks[0]);
  assert(record.header.encryption == static_cast<uint8_t>(EncryptionType::kAes256Gcm) && "/home is AES-256-GCM");
  assert(record.header.original_size == 11 && record.header.inode == fx.notes);
  assert(record.payload.size() == 12 + 11 + 16);
}

void TestPerPathEncryption() {
  auto fx = Format();
  auto engine = Mount(fx);
  const auto secret = Bytes("per-path encryption keeps this private");

  // No lookup yet: the path is recovered by walking the tree.
  (void)engine->Write(fx.app_conf, 0, secret);
  auto node = engine->ReadNode(fx.app_conf);
  auto record = engine->Blocks().ReadBlock(node->blocks[0]);
  assert(record.header.encryption == static_cast<uint8_t>(EncryptionType::kChaCha20Poly1305));
  assert(std::search(record.payload.begin(), record.payload.end(), secret.begin(), secret.end()) ==
         record.payload.end() && "ciphertext must not expose the plaintext");
  assert(engine->Read("/etc/app/conf", 0, 1024) == secret);
  assert(engine->Encryption().HasKey(record.header.key_id));

  const uint32_t scratch = engine->CreateNode(fx.tmp, "scratch", core::NodeKind::File);
  (void)engine->Write(scratch, 0, secret);
  record = engine->Blocks().ReadBlock(engine->ReadNode(scratch)->blocks[0]);
  assert(record.header.encryption == 0 && record.header.key_id == 0 && record.payload == secret &&
         "/tmp is stored in the clear");

  const auto stats = engine->Stats().encryption;
  assert(stats.total_encrypted == 1 && stats.total_decrypted == 1);
}

void TestPathsRecordedByLookups() {
  auto fx = Format();
  auto engine = Mount(fx);

  const uint32_t app = engine->LookupPath("/etc/app");
  assert(engine->KnownPath(fx.etc) == "/etc" && engine->KnownPath(app) == "/etc/app");
  assert(engine->KnownPath(fx.app_conf) == "/etc/app/conf" && "children of a looked-up directory are recorded");
  assert(!engine->KnownPath(fx.home).has_value());

  (void)engine->Write(fx.app_conf, 0, Bytes("secret=1\n"));
  assert(!engine->KnownPath(fx.home).has_value() && "a recorded path needs no tree walk");
  auto record = engine->Blocks().ReadBlock(engine->ReadNode(fx.app_conf)->blocks[0]);
  assert(record.header.encryption == static_cast<uint8_t>(EncryptionType::kChaCha20Poly1305));

  (void)engine->Write(fx.notes, 0, Bytes("walked"));
  assert(engine->KnownPath(fx.notes) == "/home/notes.txt");
  assert(engine->KnownPath(fx.tmp) == "/tmp" && "the walk records every directory it reads");
  assert(engine->Read("/home/notes.txt", 0, 6) == Bytes("walked"));
}

void TestKeyRotationDuringWrites() {
  auto fx = Format();
  orchestrator::EngineConfig config;
  config.rotation_threshold = 2;
  config.key_grace_period = std::chrono::seconds{3600};
  auto engine = Mount(fx, config);
  const uint32_t file = engine->CreateNode(fx.home, "journal", core::NodeKind::File);
  const std::size_t chunk = engine->ChunkSize();

  auto first = Pattern(chunk * 3, 4);
  (void)engine->Write(file, 0, first);
  const auto first_key = engine->Blocks().ReadBlock(engine->ReadNode(file)->blocks[0]).header.key_id;
  assert(engine->Encryption().NeedsRotation(first_key));

  (void)engine->Write(file, 0, Bytes("rotated"));
  const auto node = engine->ReadNode(file);
  const auto second_key = engine->Blocks().ReadBlock(node->blocks[0]).header.key_id;
  assert(second_key != first_key && engine->Stats().encryption.key_rotations == 1);
  assert(engine->Blocks().ReadBlock(node->blocks[1]).header.key_id == first_key);

  std::copy_n(Bytes("rotated").begin(), 7, first.begin());
  assert(engine->Read(file, 0, first.size()) == first && "chunks under the superseded key still decrypt");
}

void TestDeduplication() {
  auto fx = Format();
  auto engine = Mount(fx);
  const auto payload = Pattern(300, 7);
  const auto hash = eclipsefs::crypto::SHA256_Domain("eclipsefs.chunk.plain", {payload});
  const uint32_t a = engine->CreateNode(fx.tmp, "a", core::NodeKind::File);
  const uint32_t b = engine->CreateNode(fx.tmp, "b", core::NodeKind::File);

  (void)engine->Write(a, 0, payload);
  (void)engine->Write(b, 0, payload);
  const uint64_t shared = engine->ReadNode(a)->blocks[0];
  assert(engine->ReadNode(b)->blocks[0] == shared && "identical chunks share one block");
  assert(engine->Stats().blocks_allocated == 1 && engine->Stats().dedup_hits == 1);
  assert(engine->Dedup().Lookup(hash)->ref_count == 2);

  (void)engine->Write(a, 0, Pattern(300, 8));
  assert(engine->Dedup().Lookup(hash)->ref_count == 1 && "overwrite releases the old reference");
  assert(engine->Read(b, 0, 300) == payload);

  (void)engine->Write(b, 0, Pattern(300, 9));
  assert(!engine->Dedup().Lookup(hash).has_value());
  assert(engine->Dedup().Reclaimable().size() == 1);

  const uint32_t c = engine->CreateNode(fx.home, "c", core::NodeKind::File);
  const uint32_t d = engine->CreateNode(fx.home, "d", core::NodeKind::File);
  (void)engine->Write(c, 0, payload);
  (void)engine->Write(d, 0, payload);
  assert(engine->ReadNode(c)->blocks[0] == engine->ReadNode(d)->blocks[0] && "same key shares blocks");
  assert(engine->Stats().dedup_entries == 4 && "encrypted chunks hash with their key id");
}

void TestDedupSeparatesCleartextFromSealed() {
  auto fx = Format();
  auto engine = Mount(fx);
  const uint32_t first = engine->CreateNode(fx.home, "first", core::NodeKind::File);
  (void)engine->Write(first, 0, Bytes("x"));
  const uint64_t key = engine->Blocks().ReadBlock(engine->ReadNode(first)->blocks[0]).header.key_id;
  assert(key != 0);

  // A cleartext chunk whose bytes are the key id followed by the secret.
  const std::vector<uint8_t> secret(40, 'S');
  std::vector<uint8_t> crafted;
  eclipsefs::AppendLE64(crafted, key);
  crafted.insert(crafted.end(), secret.begin(), secret.end());
  const uint32_t plain = engine->CreateNode(fx.tmp, "crafted", core::NodeKind::File);
  (void)engine->Write(plain, 0, crafted);

  const uint32_t sealed = engine->CreateNode(fx.home, "secret", core::NodeKind::File);
  (void)engine->Write(sealed, 0, secret);
  const uint64_t sealed_block = engine->ReadNode(sealed)->blocks[0];
  assert(sealed_block != engine->ReadNode(plain)->blocks[0] && "cleartext block must not back an encrypted file");
  const auto record = engine->Blocks().ReadBlock(sealed_block);
  assert(record.header.encryption == static_cast<uint8_t>(EncryptionType::kAes256Gcm) &&
         record.header.key_id == key);
  assert(engine->Read(sealed, 0, secret.size()) == secret);
  assert(engine->Read(plain, 0, crafted.size()) == crafted);

  // An entry pointing at a block with different framing is not reused.
  const auto other = Pattern(64, 21);
  engine->Dedup().AddReference(eclipsefs::crypto::SHA256_Domain("eclipsefs.chunk.plain", {other}), sealed_block,
                               other.size());
  const uint32_t scratch = engine->CreateNode(fx.tmp, "scratch", core::NodeKind::File);
  (void)engine->Write(scratch, 0, other);
  const uint64_t scratch_block = engine->ReadNode(scratch)->blocks[0];
  assert(scratch_block != sealed_block);
  assert(engine->Blocks().ReadBlock(scratch_block).header.encryption == 0);
  assert(engine->Read(scratch, 0, other.size()) == other);
  assert(engine->Read(sealed, 0, secret.size()) == secret);
}

void TestDedupDisabled() {
  auto fx = Format();
  orchestrator::EngineConfig config;
  config.enable_dedup = false;
  auto engine = Mount(fx, config);
  const uint32_t a = engine->CreateNode(fx.tmp, "a", core::NodeKind::File);
  const uint32_t b = engine->CreateNode(fx.tmp, "b", core::NodeKind::File);
  (void)engine->Write(a, 0, Pattern(100, 1));
  (void)engine->Write(b, 0, Pattern(100, 1));
  assert(engine->Stats().blocks_allocated == 2 && engine->Stats().dedup_entries == 0);
}

void TestCompression() {
  auto fx = Format();
  orchestrator::EngineConfig config;
  config.compression = storage::CompressionType::kZstd;
  auto engine = Mount(fx, config);
  const uint32_t plain = engine->CreateNode(fx.tmp, "zeros", core::NodeKind::File);
  const std::vector<uint8_t> repetitive(engine->ChunkSize(), 'a');
  (void)engine->Write(plain, 0, repetitive);
  auto record = engine->Blocks().ReadBlock(engine->ReadNode(plain)->blocks[0]);
  assert(record.header.compression == static_cast<uint8_t>(storage::CompressionType::kZstd));
  assert(record.payload.size() < repetitive.size() && record.header.original_size == repetitive.size());
  assert(engine->Read(plain, 0, repetitive.size()) == repetitive);

  const uint32_t sealed = engine->CreateNode(fx.home, "zeros", core::NodeKind::File);
  (void)engine->Write(sealed, 0, repetitive);
  record = engine->Blocks().ReadBlock(engine->ReadNode(sealed)->blocks[0]);
  assert(record.header.compression == static_cast<uint8_t>(storage::CompressionType::kZstd) &&
         record.header.encryption == static_cast<uint8_t>(EncryptionType::kAes256Gcm) &&
         "compression happens before encryption");
  assert(engine->Read(sealed, 0, repetitive.size()) == repetitive);

  const uint32_t noise = engine->CreateNode(fx.tmp, "noise", core::NodeKind::File);
  (void)engine->Write(noise, 0, Pattern(32, 3));
  record = engine->Blocks().ReadBlock(engine->ReadNode(noise)->blocks[0]);
  assert(record.header.compression == 0 && "incompressible chunks are stored raw");
}

void TestFailedWriteLeavesNodeUntouched() {
  {
    auto fx = Format(2);
    auto engine = Mount(fx);
    const uint32_t file = engine->CreateNode(fx.tmp, "big", core::NodeKind::File);
    const auto before = engine->Stat(file);
    assert(ThrowsWith([&] { (void)engine->Write(file, 0, Pattern(engine->ChunkSize() * 3, 1)); },
                      eclipsefs::ErrorDomain::OutOfSpace, eclipsefs::errors::space::kNoFreeBlocks));
    const auto after = engine->Stat(file);
    assert(after.size == before.size && after.version == before.version);
    assert(engine->Stats().free_blocks == 0);
  }
  {
    auto fx = Format();
    auto engine = Mount(fx);
    const uint32_t file = engine->CreateNode(fx.tmp, "flaky", core::NodeKind::File);
    fx.store->FailWritesAfter(0);
    assert(ThrowsWith([&] { (void)engine->Write(file, 0, Bytes("lost")); }, eclipsefs::ErrorDomain::IO,
                      eclipsefs::errors::io::kWriteFailed));
    assert(engine->Stat(file).version == 1 && engine->ReadNode(file)->blocks.empty());
  }
  {
    auto fx = Format();
    auto engine = Mount(fx);
    const uint32_t file = engine->CreateNode(fx.tmp, "huge", core::NodeKind::File);
    assert(ThrowsWith([&] { (void)engine->Write(file, 0xFFFFFFFFull, Bytes("xy")); },
                      eclipsefs::ErrorDomain::InvalidArgument, eclipsefs::errors::argument::kPayloadTooLarge));
    assert(engine->Write(file, 0, std::vector<uint8_t>{}) == 0);
    assert(ThrowsWith([&] { (void)engine->Write(fx.tmp, 0, Bytes("x")); },
                      eclipsefs::ErrorDomain::InvalidOperation, eclipsefs::errors::operation::kIsADirectory));
  }
}

void TestSyncPersistsFreeBlocks() {
  auto fx = Format(64);
  {
    auto engine = Mount(fx);
    const uint32_t file = engine->CreateNode(fx.tmp, "log", core::NodeKind::File);
    (void)engine->Write(file, 0, Pattern(engine->ChunkSize() * 2, 5));
    engine->Sync();
    core::HeaderBytes bytes{};
    fx.store->ReadExact(0, bytes);
    const auto header = core::ParseHeader(bytes);
    assert(header.free_blocks == 62 && "sync rewrites the sealed header");
    assert(core::HeaderLabel(header) == "engine-test");
  }
  const auto size_after_first_mount = fx.store->Size();
  auto remount = Mount(fx);
  assert(remount->Header().free_blocks == 62);
  assert(remount->Blocks().RegionOffset() >= size_after_first_mount && "a remount never overwrites old blocks");
  assert(remount->ReadNode(fx.tmp)->children.empty() && "nodes created during a mount are not journaled");
}

void TestSnapshots() {
  auto fx = Format();
  auto engine = Mount(fx);
  const uint32_t file = engine->CreateNode(fx.tmp, "f", core::NodeKind::File);
  (void)engine->Write(file, 0, Pattern(10, 1));
  const uint64_t base = engine->CreateSnapshot("base");
  const uint64_t child = engine->CreateSnapshot("child", base);
  assert(base == 1 && child == 2);
  const auto info = engine->Snapshots().Get(child);
  assert(info && info->parent == base && info->block_count == 1 && info->inode_count == 8);
  assert(ThrowsWith([&] { (void)engine->CreateSnapshot("orphan", 99); }, eclipsefs::ErrorDomain::NotFound,
                    eclipsefs::errors::lookup::kSnapshotMissing));
  assert(engine->Stats().snapshots == 2);
}

void TestCacheStatsAndPrefetch() {
  auto fx = Format();
  orchestrator::EngineConfig config;
  config.cache_strategy = storage::CacheStrategy::kLru;
  config.cache_capacity = 16;
  auto engine = Mount(fx, config);
  assert(engine->PrefetchDirectory(core::kRootInode) == 3);
  const auto before = engine->Stats().cache;
  (void)engine->ReadNode(fx.etc);
  const auto after = engine->Stats().cache;
  assert(after.hits == before.hits + 1 && after.capacity == 16);

  orchestrator::EngineConfig bad;
  bad.cache_capacity = 0;
  assert(ThrowsWith([&] { (void)Mount(fx, bad); }, eclipsefs::ErrorDomain::InvalidArgument,
                    eclipsefs::errors::argument::kBadConfigValue));
}

}  // namespace

int main() {
  TestInlineReads();
  TestCreateNode();
  TestCopyOnWriteAcrossChunks();
  TestSparseWrite();
  TestInlineFilePromotedToBlocks();
  TestPerPathEncryption();
  TestPathsRecordedByLookups();
  TestKeyRotationDuringWrites();
  TestDeduplication();
  TestDedupSeparatesCleartextFromSealed();
  TestDedupDisabled();
  TestCompression();
  TestFailedWriteLeavesNodeUntouched();
  TestSyncPersistsFreeBlocks();
  TestSnapshots();
  TestCacheStatsAndPrefetch();
  std::cout << "engine tests ok\n";
  return 0;
}
