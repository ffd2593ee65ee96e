#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace eclipsefs::core {

inline constexpr uint32_t kRootInode = 1;

inline constexpr uint32_t kDefaultDirectoryMode = 0040755;
inline constexpr uint32_t kDefaultFileMode = 0100644;
inline constexpr uint32_t kDefaultSymlinkMode = 0120777;

enum class NodeKind : uint8_t {
  File = 1,
  Directory = 2,
  Symlink = 3,
};

const char* NodeKindName(NodeKind kind) noexcept;

using ContentHash = std::array<uint8_t, 32>;

// Decoded inode. Directories keep their children ordered by name so that
// encoding is deterministic.
struct Node {
  NodeKind kind{NodeKind::File};
  uint32_t mode{kDefaultFileMode};
  uint32_t uid{0};
  uint32_t gid{0};
  uint64_t size{0};
  uint64_t atime{0};
  uint64_t mtime{0};
  uint64_t ctime{0};
  uint32_t nlink{1};
  std::vector<uint8_t> data;
  std::map<std::string, uint32_t> children;
  uint64_t version{1};
  std::optional<uint64_t> parent_version;
  bool is_snapshot{false};
  std::optional<ContentHash> dedup_hash;
  std::vector<uint64_t> blocks;
  uint32_t checksum{0};

  [[nodiscard]] bool IsDirectory() const noexcept { return kind == NodeKind::Directory; }
  [[nodiscard]] bool IsFile() const noexcept { return kind == NodeKind::File; }
  [[nodiscard]] bool IsSymlink() const noexcept { return kind == NodeKind::Symlink; }

  bool operator==(const Node&) const = default;

  static Node MakeDirectory(uint32_t mode = kDefaultDirectoryMode);
  static Node MakeFile(std::span<const uint8_t> content, uint32_t mode = kDefaultFileMode);
  static Node MakeSymlink(std::string_view target);
};

struct NodeStat {
  uint32_t inode{0};
  NodeKind kind{NodeKind::File};
  uint64_t size{0};
  uint32_t mode{0};
  uint32_t uid{0};
  uint32_t gid{0};
  uint64_t atime{0};
  uint64_t mtime{0};
  uint64_t ctime{0};
  uint32_t nlink{0};
  uint64_t version{0};
};

NodeStat MakeStat(uint32_t inode, const Node& node) noexcept;

uint64_t UnixNow() noexcept;

}  // namespace eclipsefs::core
