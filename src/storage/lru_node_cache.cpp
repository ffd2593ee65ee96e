#include "eclipsefs/storage/node_cache.h"

#include <cassert>

#include "eclipsefs/error.h"

namespace eclipsefs::storage {

LruNodeCache::LruNodeCache(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw Error{ErrorDomain::InvalidArgument, errors::argument::kBadConfigValue,
                "Cache capacity must be at least one node"};
  }
  entries_.reserve(capacity_);
}

NodePtr LruNodeCache::Get(uint32_t inode) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(inode);
  if (it == entries_.end()) {
    ++misses_;
    return nullptr;
  }
  ++hits_;
  TouchLocked(it->second);
  return it->second.node;
}

void LruNodeCache::Put(uint32_t inode, NodePtr node) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = entries_.find(inode); it != entries_.end()) {
    it->second.node = std::move(node);
    TouchLocked(it->second);
    CheckInvariantsLocked();
    return;
  }
  while (entries_.size() >= capacity_) {
    EvictLRULocked();
  }
  lru_list_.push_front(inode);
  entries_.emplace(inode, Entry{std::move(node), lru_list_.begin()});
  CheckInvariantsLocked();
}

void LruNodeCache::Invalidate(uint32_t inode) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(inode);
  if (it == entries_.end()) {
    return;
  }
  lru_list_.erase(it->second.position);
  entries_.erase(it);
}

void LruNodeCache::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  lru_list_.clear();
}

bool LruNodeCache::Contains(uint32_t inode) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(inode) != 0;
}

std::size_t LruNodeCache::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

CacheStats LruNodeCache::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CacheStats{hits_, misses_, entries_.size(), capacity_};
}

void LruNodeCache::TouchLocked(Entry& entry) {
  lru_list_.splice(lru_list_.begin(), lru_list_, entry.position);
  entry.position = lru_list_.begin();
}

void LruNodeCache::EvictLRULocked() {
  if (lru_list_.empty()) {
    return;
  }
  const uint32_t victim = lru_list_.back();
  lru_list_.pop_back();
  entries_.erase(victim);
}

void LruNodeCache::CheckInvariantsLocked() const {
#ifndef NDEBUG
  assert(entries_.size() == lru_list_.size() && "LRU list and map must agree");
  assert(entries_.size() <= capacity_ && "LRU cache over capacity");
#endif
}

}  // namespace eclipsefs::storage
