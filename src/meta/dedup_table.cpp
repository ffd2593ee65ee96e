#include "eclipsefs/meta/dedup_table.h"

#include "eclipsefs/error.h"
#include "eclipsefs/errors.h"

namespace eclipsefs::meta {

DedupInfo DedupTable::AddReference(const ContentHash& hash, uint64_t block_id, uint64_t size) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = entries_.try_emplace(hash, DedupInfo{0, block_id, size});
  auto& info = it->second;
  if (!inserted && info.ref_count == 0 && info.block_id != block_id) {
    by_block_.erase(info.block_id);
    info.block_id = block_id;
    info.size = size;
  }
  ++info.ref_count;
  by_block_[info.block_id] = hash;
  return info;
}

std::optional<DedupInfo> DedupTable::Lookup(const ContentHash& hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(hash);
  if (it == entries_.end() || it->second.ref_count == 0) {
    return std::nullopt;
  }
  return it->second;
}

uint32_t DedupTable::Release(const ContentHash& hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(hash);
  if (it == entries_.end() || it->second.ref_count == 0) {
    throw Error{ErrorDomain::NotFound, errors::lookup::kDedupEntryMissing,
                std::string(errors::msg::kDedupEntryNotFound)};
  }
  return --it->second.ref_count;
}

std::vector<ContentHash> DedupTable::Reclaimable() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ContentHash> out;
  for (const auto& [hash, info] : entries_) {
    if (info.ref_count == 0) {
      out.push_back(hash);
    }
  }
  return out;
}

std::optional<ContentHash> DedupTable::HashForBlock(uint64_t block_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_block_.find(block_id);
  if (it == by_block_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t DedupTable::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

uint64_t DedupTable::TotalReferences() const {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t total = 0;
  for (const auto& [hash, info] : entries_) {
    total += info.ref_count;
  }
  return total;
}

}  // namespace eclipsefs::meta
