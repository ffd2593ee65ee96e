#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "eclipsefs/core/header.h"

namespace eclipsefs::storage {
class BackingStore;
}

namespace eclipsefs::core {

enum class ProblemSeverity : uint8_t { kWarning, kError };

struct IntegrityProblem {
  ProblemSeverity severity{ProblemSeverity::kError};
  uint32_t inode{0}; // 0 for image-level problems
  std::string description;
};

struct IntegrityCheckResult {
  bool ok{false};
  FsHeader header{};
  std::size_t nodes_checked{0};
  std::size_t directories{0};
  std::size_t files{0};
  std::size_t symlinks{0};
  std::vector<IntegrityProblem> problems;

  [[nodiscard]] std::size_t ErrorCount() const noexcept;
};

// Walks the header, the inode table and every node record. Decode failures,
// dangling directory entries and unreachable inodes are errors; link count
// drift is a warning. Never throws for on-disk damage; I/O failures on the
// store still propagate.
IntegrityCheckResult VerifyImageIntegrity(std::shared_ptr<storage::BackingStore> store);

}  // namespace eclipsefs::core
