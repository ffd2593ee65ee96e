#include "eclipsefs/core/node.h"

#include <chrono>

namespace eclipsefs::core {

const char* NodeKindName(NodeKind kind) noexcept {
  switch (kind) {
  case NodeKind::File:
    return "file";
  case NodeKind::Directory:
    return "directory";
  case NodeKind::Symlink:
    return "symlink";
  }
  return "unknown";
}

uint64_t UnixNow() noexcept {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

Node Node::MakeDirectory(uint32_t mode) {
  Node node;
  node.kind = NodeKind::Directory;
  node.mode = mode;
  node.nlink = 2;
  node.atime = node.mtime = node.ctime = UnixNow();
  return node;
}

Node Node::MakeFile(std::span<const uint8_t> content, uint32_t mode) {
  Node node;
  node.kind = NodeKind::File;
  node.mode = mode;
  node.nlink = 1;
  node.data.assign(content.begin(), content.end());
  node.size = node.data.size();
  node.atime = node.mtime = node.ctime = UnixNow();
  return node;
}

Node Node::MakeSymlink(std::string_view target) {
  Node node;
  node.kind = NodeKind::Symlink;
  node.mode = kDefaultSymlinkMode;
  node.nlink = 1;
  node.data.assign(target.begin(), target.end());
  node.size = node.data.size();
  node.atime = node.mtime = node.ctime = UnixNow();
  return node;
}

NodeStat MakeStat(uint32_t inode, const Node& node) noexcept {
  NodeStat stat;
  stat.inode = inode;
  stat.kind = node.kind;
  stat.size = node.size;
  stat.mode = node.mode;
  stat.uid = node.uid;
  stat.gid = node.gid;
  stat.atime = node.atime;
  stat.mtime = node.mtime;
  stat.ctime = node.ctime;
  stat.nlink = node.nlink;
  stat.version = node.version;
  return stat;
}

}  // namespace eclipsefs::core
