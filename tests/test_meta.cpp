#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "eclipsefs/error.h"
#include "eclipsefs/meta/dedup_table.h"
#include "eclipsefs/meta/snapshot_table.h"

namespace {

namespace meta = eclipsefs::meta;

meta::ContentHash HashOf(uint8_t seed) {
  meta::ContentHash hash{};
  hash.fill(seed);
  return hash;
}

void TestSnapshotCreateAndList() {
  meta::SnapshotTable table;
  const auto base = table.Create("base", std::nullopt, 10, 4, 1000);
  const auto nightly = table.Create("nightly", base, 12, 6, 2000);
  assert(base == 1 && nightly == 2 && table.size() == 2);

  const auto info = table.Get(nightly);
  assert(info && info->name == "nightly" && info->parent == base);
  assert(info->inode_count == 12 && info->block_count == 6 && info->timestamp == 2000);
  assert(!table.Get(99).has_value());

  const auto all = table.List();
  assert(all.size() == 2 && all[0].id == base && all[1].id == nightly);

  const auto dup = table.Create("nightly", std::nullopt, 1, 1, 3000);
  assert(dup == 3 && "names need not be unique");
}

void TestSnapshotLineage() {
  meta::SnapshotTable table;
  const auto a = table.Create("a", std::nullopt, 1, 0, 1);
  const auto b = table.Create("b", a, 1, 0, 2);
  const auto c = table.Create("c", b, 1, 0, 3);
  assert((table.Lineage(c) == std::vector<uint64_t>{c, b, a}));
  assert((table.Lineage(a) == std::vector<uint64_t>{a}));

  bool missing_parent = false;
  try {
    (void)table.Create("orphan", 42, 0, 0, 4);
  } catch (const eclipsefs::Error& err) {
    missing_parent = err.domain == eclipsefs::ErrorDomain::NotFound &&
                     err.code == eclipsefs::errors::lookup::kSnapshotMissing;
  }
  assert(missing_parent && "parent must exist");
  assert(table.size() == 3 && "failed create leaves no entry");

  bool missing_lineage = false;
  try {
    (void)table.Lineage(77);
  } catch (const eclipsefs::Error& err) {
    missing_lineage = err.domain == eclipsefs::ErrorDomain::NotFound;
  }
  assert(missing_lineage);
}

void TestDedupReferences() {
  meta::DedupTable table;
  const auto hash = HashOf(0xAB);
  assert(!table.Lookup(hash).has_value());

  auto info = table.AddReference(hash, 7, 4096);
  assert(info.ref_count == 1 && info.block_id == 7 && info.size == 4096);
  info = table.AddReference(hash, 9, 4096);
  assert(info.ref_count == 2 && info.block_id == 7 && "a live entry keeps its first block");
  assert(table.HashForBlock(7) == hash && !table.HashForBlock(9).has_value());
  assert(table.TotalReferences() == 2);

  assert(table.Release(hash) == 1);
  assert(table.Release(hash) == 0);
  assert(!table.Lookup(hash).has_value() && "zero-reference entries are not live");
  assert(table.size() == 1 && table.Reclaimable().size() == 1);

  bool underflow = false;
  try {
    (void)table.Release(hash);
  } catch (const eclipsefs::Error& err) {
    underflow = err.domain == eclipsefs::ErrorDomain::NotFound &&
                err.code == eclipsefs::errors::lookup::kDedupEntryMissing;
  }
  assert(underflow && "releasing a dead entry is NotFound");

  bool unknown = false;
  try {
    (void)table.Release(HashOf(1));
  } catch (const eclipsefs::Error& err) {
    unknown = err.domain == eclipsefs::ErrorDomain::NotFound;
  }
  assert(unknown);
}

void TestDedupRebind() {
  meta::DedupTable table;
  const auto hash = HashOf(0x11);
  (void)table.AddReference(hash, 3, 100);
  (void)table.Release(hash);
  const auto info = table.AddReference(hash, 8, 100);
  assert(info.ref_count == 1 && info.block_id == 8 && "a dead entry rebinds to the new block");
  assert(!table.HashForBlock(3).has_value() && table.HashForBlock(8) == hash);
  assert(table.Reclaimable().empty() && table.size() == 1);
}

void TestDedupConcurrentReferences() {
  meta::DedupTable table;
  const auto hash = HashOf(0x42);
  constexpr int kThreads = 4;
  constexpr int kPerThread = 500;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&table, &hash] {
      for (int i = 0; i < kPerThread; ++i) {
        (void)table.AddReference(hash, 1, 64);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  assert(table.Lookup(hash)->ref_count == kThreads * kPerThread);
}

}  // namespace

int main() {
  TestSnapshotCreateAndList();
  TestSnapshotLineage();
  TestDedupReferences();
  TestDedupRebind();
  TestDedupConcurrentReferences();
  std::cout << "meta tests ok\n";
  return 0;
}
