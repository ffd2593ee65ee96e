#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>

#include "eclipsefs/core/node.h"

namespace eclipsefs::storage {

using NodePtr = std::shared_ptr<const core::Node>;

struct CacheStats {
  uint64_t hits{0};
  uint64_t misses{0};
  std::size_t size{0};
  std::size_t capacity{0};

  [[nodiscard]] double HitRate() const noexcept {
    const uint64_t total = hits + misses;
    return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
  }
};

// Eviction strategy over decoded nodes. A miss is not an error: callers
// decode from storage and Put() the result.
class NodeCache {
public:
  virtual ~NodeCache() = default;

  virtual NodePtr Get(uint32_t inode) = 0;
  virtual void Put(uint32_t inode, NodePtr node) = 0;
  virtual void Invalidate(uint32_t inode) = 0;
  virtual void Clear() = 0;
  [[nodiscard]] virtual bool Contains(uint32_t inode) const = 0;
  [[nodiscard]] virtual std::size_t Size() const = 0;
  [[nodiscard]] virtual std::size_t Capacity() const = 0;
  [[nodiscard]] virtual CacheStats Stats() const = 0;
  [[nodiscard]] virtual const char* Name() const noexcept = 0;

  void Put(uint32_t inode, core::Node node) {
    Put(inode, std::make_shared<const core::Node>(std::move(node)));
  }
};

// Recency-only strategy.
class LruNodeCache final : public NodeCache {
public:
  explicit LruNodeCache(std::size_t capacity);

  NodePtr Get(uint32_t inode) override;
  void Put(uint32_t inode, NodePtr node) override;
  using NodeCache::Put;
  void Invalidate(uint32_t inode) override;
  void Clear() override;
  [[nodiscard]] bool Contains(uint32_t inode) const override;
  [[nodiscard]] std::size_t Size() const override;
  [[nodiscard]] std::size_t Capacity() const override { return capacity_; }
  [[nodiscard]] CacheStats Stats() const override;
  [[nodiscard]] const char* Name() const noexcept override { return "lru"; }

private:
  struct Entry {
    NodePtr node;
    std::list<uint32_t>::iterator position;
  };

  void TouchLocked(Entry& entry);
  void EvictLRULocked();
  void CheckInvariantsLocked() const;

  std::size_t capacity_;
  std::unordered_map<uint32_t, Entry> entries_;
  std::list<uint32_t> lru_list_; // front = most recent
  uint64_t hits_{0};
  uint64_t misses_{0};
  mutable std::mutex mutex_;
};

// Adaptive replacement cache: T1 (seen once), T2 (seen at least twice) and
// their ghost lists B1/B2 of evicted keys. |p| is the target size of T1.
class ArcNodeCache final : public NodeCache {
public:
  struct ArcState {
    std::size_t p{0};
    std::size_t t1{0};
    std::size_t t2{0};
    std::size_t b1{0};
    std::size_t b2{0};
  };

  explicit ArcNodeCache(std::size_t capacity);

  NodePtr Get(uint32_t inode) override;
  void Put(uint32_t inode, NodePtr node) override;
  using NodeCache::Put;
  void Invalidate(uint32_t inode) override;
  void Clear() override;
  [[nodiscard]] bool Contains(uint32_t inode) const override;
  [[nodiscard]] std::size_t Size() const override;
  [[nodiscard]] std::size_t Capacity() const override { return capacity_; }
  [[nodiscard]] CacheStats Stats() const override;
  [[nodiscard]] const char* Name() const noexcept override { return "arc"; }

  [[nodiscard]] ArcState State() const;

private:
  enum class ListId : uint8_t { kT1, kT2, kB1, kB2 };

  struct Entry {
    ListId list{ListId::kT1};
    std::list<uint32_t>::iterator position;
    NodePtr node; // empty while the key sits in a ghost list
  };

  std::list<uint32_t>& ListFor(ListId id);
  void MoveToMruLocked(Entry& entry, ListId target);
  void ReplaceLocked(bool hit_in_b2);
  void DropLruLocked(ListId id);
  void CheckInvariantsLocked() const;

  std::size_t capacity_;
  std::size_t p_{0};
  std::list<uint32_t> t1_;
  std::list<uint32_t> t2_;
  std::list<uint32_t> b1_;
  std::list<uint32_t> b2_;
  std::unordered_map<uint32_t, Entry> entries_;
  uint64_t hits_{0};
  uint64_t misses_{0};
  mutable std::mutex mutex_;
};

enum class CacheStrategy : uint8_t { kLru, kArc };

const char* CacheStrategyName(CacheStrategy strategy) noexcept;
std::optional<CacheStrategy> ParseCacheStrategy(std::string_view text);

// Throws Error{InvalidArgument} for a zero capacity.
std::unique_ptr<NodeCache> MakeNodeCache(CacheStrategy strategy, std::size_t capacity);

}  // namespace eclipsefs::storage
