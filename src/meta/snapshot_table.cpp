#include "eclipsefs/meta/snapshot_table.h"

#include "eclipsefs/error.h"
#include "eclipsefs/errors.h"

namespace eclipsefs::meta {

namespace {

[[noreturn]] void ThrowMissing(uint64_t id) {
  throw Error{ErrorDomain::NotFound, errors::lookup::kSnapshotMissing,
              std::string(errors::msg::kSnapshotNotFound) + ": " + std::to_string(id)};
}

}  // namespace

uint64_t SnapshotTable::Create(std::string name, std::optional<uint64_t> parent, uint64_t inode_count,
                               uint64_t block_count, uint64_t timestamp) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (parent && snapshots_.count(*parent) == 0) {
    ThrowMissing(*parent);
  }
  const uint64_t id = next_id_.fetch_add(1, std::memory_order_relaxed);
  snapshots_.emplace(id, SnapshotInfo{id, timestamp, std::move(name), parent, inode_count, block_count});
  return id;
}

std::optional<SnapshotInfo> SnapshotTable::Get(uint64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = snapshots_.find(id);
  if (it == snapshots_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<SnapshotInfo> SnapshotTable::List() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SnapshotInfo> out;
  out.reserve(snapshots_.size());
  for (const auto& [id, info] : snapshots_) {
    out.push_back(info);
  }
  return out;
}

std::vector<uint64_t> SnapshotTable::Lineage(uint64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<uint64_t> chain;
  std::optional<uint64_t> current = id;
  while (current) {
    auto it = snapshots_.find(*current);
    if (it == snapshots_.end()) {
      ThrowMissing(*current);
    }
    chain.push_back(*current);
    current = it->second.parent;
  }
  return chain;
}

std::size_t SnapshotTable::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshots_.size();
}

}  // namespace eclipsefs::meta
