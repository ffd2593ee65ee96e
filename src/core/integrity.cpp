#include "eclipsefs/core/integrity.h"

#include <algorithm>
#include <deque>
#include <map>
#include <set>

#include "eclipsefs/error.h"
#include "eclipsefs/storage/backing_store.h"
#include "eclipsefs/storage/node_cache.h"
#include "eclipsefs/storage/node_reader.h"

namespace eclipsefs::core {

namespace {

// Nodes are decoded once each; a tiny cache is enough.
constexpr std::size_t kCheckCacheCapacity = 64;

void AddProblem(IntegrityCheckResult& result, ProblemSeverity severity, uint32_t inode, std::string description) {
  result.problems.push_back(IntegrityProblem{severity, inode, std::move(description)});
}

}  // namespace

std::size_t IntegrityCheckResult::ErrorCount() const noexcept {
  return static_cast<std::size_t>(std::count_if(problems.begin(), problems.end(), [](const IntegrityProblem& p) {
    return p.severity == ProblemSeverity::kError;
  }));
}

IntegrityCheckResult VerifyImageIntegrity(std::shared_ptr<storage::BackingStore> store) {
  IntegrityCheckResult result;

  std::unique_ptr<storage::NodeReader> reader;
  try {
    reader = std::make_unique<storage::NodeReader>(
        store, storage::MakeNodeCache(storage::CacheStrategy::kLru, kCheckCacheCapacity));
  } catch (const Error& error) {
    if (error.domain == ErrorDomain::IO) {
      throw;
    }
    AddProblem(result, ProblemSeverity::kError, 0, error.what());
    return result;
  }
  result.header = reader->header();

  std::map<uint32_t, std::shared_ptr<const Node>> decoded;
  for (uint32_t inode : reader->KnownInodes()) {
    try {
      auto node = reader->ReadNode(inode);
      decoded.emplace(inode, node);
      ++result.nodes_checked;
      switch (node->kind) {
        case NodeKind::Directory:
          ++result.directories;
          break;
        case NodeKind::File:
          ++result.files;
          break;
        case NodeKind::Symlink:
          ++result.symlinks;
          break;
      }
    } catch (const Error& error) {
      if (error.domain == ErrorDomain::IO) {
        // A record past the end of the image surfaces as a short read.
        AddProblem(result, ProblemSeverity::kError, inode, std::string("unreadable record: ") + error.what());
        continue;
      }
      AddProblem(result, ProblemSeverity::kError, inode, error.what());
    }
  }

  auto root = decoded.find(kRootInode);
  if (root == decoded.end()) {
    AddProblem(result, ProblemSeverity::kError, kRootInode, "root directory missing or unreadable");
  } else if (!root->second->IsDirectory()) {
    AddProblem(result, ProblemSeverity::kError, kRootInode, "root inode is not a directory");
  }

  std::set<uint32_t> reachable;
  std::deque<uint32_t> pending;
  if (root != decoded.end()) {
    pending.push_back(kRootInode);
  }
  while (!pending.empty()) {
    const uint32_t inode = pending.front();
    pending.pop_front();
    if (!reachable.insert(inode).second) {
      continue;
    }
    auto it = decoded.find(inode);
    if (it == decoded.end() || !it->second->IsDirectory()) {
      continue;
    }
    uint32_t subdirectories = 0;
    for (const auto& [name, child] : it->second->children) {
      if (!reader->Exists(child)) {
        AddProblem(result, ProblemSeverity::kError, inode,
                   "entry '" + name + "' points at missing inode " + std::to_string(child));
        continue;
      }
      auto child_node = decoded.find(child);
      if (child_node != decoded.end() && child_node->second->IsDirectory()) {
        ++subdirectories;
      }
      pending.push_back(child);
    }
    if (it->second->nlink != subdirectories + 2) {
      AddProblem(result, ProblemSeverity::kWarning, inode,
                 "link count " + std::to_string(it->second->nlink) + ", expected " +
                     std::to_string(subdirectories + 2));
    }
  }

  for (const auto& [inode, node] : decoded) {
    if (reachable.count(inode) == 0) {
      AddProblem(result, ProblemSeverity::kError, inode, "not reachable from the root directory");
    }
  }

  result.ok = result.ErrorCount() == 0;
  return result;
}

}  // namespace eclipsefs::core
