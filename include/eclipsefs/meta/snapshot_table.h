#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace eclipsefs::meta {

// Immutable once created. Snapshots are metadata only; they never pin blocks.
struct SnapshotInfo {
  uint64_t id{0};
  uint64_t timestamp{0};
  std::string name;
  std::optional<uint64_t> parent;
  uint64_t inode_count{0};
  uint64_t block_count{0};
};

class SnapshotTable {
public:
  // |parent|, when set, must name an existing snapshot (Error{NotFound}).
  uint64_t Create(std::string name, std::optional<uint64_t> parent, uint64_t inode_count,
                  uint64_t block_count, uint64_t timestamp);

  [[nodiscard]] std::optional<SnapshotInfo> Get(uint64_t id) const;
  [[nodiscard]] std::vector<SnapshotInfo> List() const;

  // |id| first, then each parent up to the root ancestor.
  [[nodiscard]] std::vector<uint64_t> Lineage(uint64_t id) const;

  [[nodiscard]] std::size_t size() const;

private:
  std::map<uint64_t, SnapshotInfo> snapshots_;
  std::atomic<uint64_t> next_id_{1};
  mutable std::mutex mutex_;
};

}  // namespace eclipsefs::meta
