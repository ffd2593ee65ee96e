#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace eclipsefs::meta {

using ContentHash = std::array<uint8_t, 32>;

struct DedupInfo {
  uint32_t ref_count{0};
  uint64_t block_id{0};
  uint64_t size{0};
};

// Content hash to shared block. At most one live block per hash; entries at
// zero references stay until reclaimed and are reported by Reclaimable().
class DedupTable {
public:
  // Increments a live entry, or (re)binds the hash to |block_id| with one
  // reference. Returns the entry after the update.
  DedupInfo AddReference(const ContentHash& hash, uint64_t block_id, uint64_t size);

  // Live entries only.
  [[nodiscard]] std::optional<DedupInfo> Lookup(const ContentHash& hash) const;

  // Throws Error{NotFound} for an unknown hash. Returns the remaining count.
  uint32_t Release(const ContentHash& hash);

  [[nodiscard]] std::vector<ContentHash> Reclaimable() const;
  [[nodiscard]] std::optional<ContentHash> HashForBlock(uint64_t block_id) const;

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] uint64_t TotalReferences() const;

private:
  std::map<ContentHash, DedupInfo> entries_;
  std::unordered_map<uint64_t, ContentHash> by_block_;
  mutable std::mutex mutex_;
};

}  // namespace eclipsefs::meta
