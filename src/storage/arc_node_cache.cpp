#include "eclipsefs/storage/node_cache.h"

#include <algorithm>
#include <cassert>

#include "eclipsefs/error.h"

namespace eclipsefs::storage {

ArcNodeCache::ArcNodeCache(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw Error{ErrorDomain::InvalidArgument, errors::argument::kBadConfigValue,
                "Cache capacity must be at least one node"};
  }
  entries_.reserve(capacity_ * 2);
}

std::list<uint32_t>& ArcNodeCache::ListFor(ListId id) {
  switch (id) {
  case ListId::kT1:
    return t1_;
  case ListId::kT2:
    return t2_;
  case ListId::kB1:
    return b1_;
  case ListId::kB2:
    return b2_;
  }
  return t1_;
}

void ArcNodeCache::MoveToMruLocked(Entry& entry, ListId target) {
  auto& source = ListFor(entry.list);
  auto& destination = ListFor(target);
  destination.splice(destination.begin(), source, entry.position);
  entry.position = destination.begin();
  entry.list = target;
}

void ArcNodeCache::DropLruLocked(ListId id) {
  auto& list = ListFor(id);
  if (list.empty()) {
    return;
  }
  entries_.erase(list.back());
  list.pop_back();
}

// Demotes one resident entry to its ghost list.
void ArcNodeCache::ReplaceLocked(bool hit_in_b2) {
  const std::size_t t1_size = t1_.size();
  const bool from_t1 = t1_size >= 1 && (t1_size > p_ || (hit_in_b2 && t1_size == p_));
  if (from_t1 || t2_.empty()) {
    if (t1_.empty()) {
      return;
    }
    auto& entry = entries_.at(t1_.back());
    entry.node.reset();
    MoveToMruLocked(entry, ListId::kB1);
    return;
  }
  auto& entry = entries_.at(t2_.back());
  entry.node.reset();
  MoveToMruLocked(entry, ListId::kB2);
}

NodePtr ArcNodeCache::Get(uint32_t inode) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(inode);
  if (it == entries_.end() || it->second.list == ListId::kB1 || it->second.list == ListId::kB2) {
    ++misses_;
    return nullptr;
  }
  ++hits_;
  MoveToMruLocked(it->second, ListId::kT2);
  CheckInvariantsLocked();
  return it->second.node;
}

void ArcNodeCache::Put(uint32_t inode, NodePtr node) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t c = capacity_;

  if (auto it = entries_.find(inode); it != entries_.end()) {
    Entry& entry = it->second;
    switch (entry.list) {
    case ListId::kT1:
    case ListId::kT2:
      entry.node = std::move(node);
      MoveToMruLocked(entry, ListId::kT2);
      break;
    case ListId::kB1: {
      // Recency list was too small: grow its target.
      const std::size_t delta = std::max<std::size_t>(1, b2_.size() / b1_.size());
      p_ = std::min(c, p_ + delta);
      if (t1_.size() + t2_.size() >= c) {
        ReplaceLocked(false);
      }
      entry.node = std::move(node);
      MoveToMruLocked(entry, ListId::kT2);
      break;
    }
    case ListId::kB2: {
      const std::size_t delta = std::max<std::size_t>(1, b1_.size() / b2_.size());
      p_ = p_ > delta ? p_ - delta : 0;
      if (t1_.size() + t2_.size() >= c) {
        ReplaceLocked(true);
      }
      entry.node = std::move(node);
      MoveToMruLocked(entry, ListId::kT2);
      break;
    }
    }
    CheckInvariantsLocked();
    return;
  }

  const std::size_t l1 = t1_.size() + b1_.size();
  if (l1 >= c) {
    if (t1_.size() < c) {
      DropLruLocked(ListId::kB1);
      if (t1_.size() + t2_.size() >= c) {
        ReplaceLocked(false);
      }
    } else {
      DropLruLocked(ListId::kT1);
    }
  } else {
    const std::size_t total = l1 + t2_.size() + b2_.size();
    if (total >= c) {
      if (total >= 2 * c) {
        DropLruLocked(ListId::kB2);
      }
      if (t1_.size() + t2_.size() >= c) {
        ReplaceLocked(false);
      }
    }
  }

  t1_.push_front(inode);
  entries_.emplace(inode, Entry{ListId::kT1, t1_.begin(), std::move(node)});
  CheckInvariantsLocked();
}

void ArcNodeCache::Invalidate(uint32_t inode) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(inode);
  if (it == entries_.end()) {
    return;
  }
  ListFor(it->second.list).erase(it->second.position);
  entries_.erase(it);
}

void ArcNodeCache::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  t1_.clear();
  t2_.clear();
  b1_.clear();
  b2_.clear();
  entries_.clear();
  p_ = 0;
}

bool ArcNodeCache::Contains(uint32_t inode) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(inode);
  return it != entries_.end() && (it->second.list == ListId::kT1 || it->second.list == ListId::kT2);
}

std::size_t ArcNodeCache::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return t1_.size() + t2_.size();
}

CacheStats ArcNodeCache::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CacheStats{hits_, misses_, t1_.size() + t2_.size(), capacity_};
}

ArcNodeCache::ArcState ArcNodeCache::State() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ArcState{p_, t1_.size(), t2_.size(), b1_.size(), b2_.size()};
}

void ArcNodeCache::CheckInvariantsLocked() const {
#ifndef NDEBUG
  assert(t1_.size() + t2_.size() <= capacity_ && "ARC resident set over capacity");
  assert(t1_.size() + b1_.size() <= capacity_ && "ARC L1 over capacity");
  assert(t1_.size() + t2_.size() + b1_.size() + b2_.size() <= 2 * capacity_ && "ARC directory over 2c");
  assert(entries_.size() == t1_.size() + t2_.size() + b1_.size() + b2_.size() && "ARC index out of sync");
  assert(p_ <= capacity_ && "ARC target out of range");
#endif
}

}  // namespace eclipsefs::storage
