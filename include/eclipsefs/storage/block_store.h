#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <unordered_map>
#include <vector>

#include "eclipsefs/storage/backing_store.h"

namespace eclipsefs::storage {

inline constexpr uint32_t kBlockMagic = 0x324B4C42;       // "BLK2"
inline constexpr uint32_t kBlockFooterMagic = 0x32444E45; // "END2"
inline constexpr std::size_t kBlockHeaderSize = 58;
inline constexpr std::size_t kBlockFooterSize = 8;
inline constexpr std::size_t kBlockOverhead = kBlockHeaderSize + kBlockFooterSize;

namespace block_layout {
inline constexpr std::size_t kMagic = 0;
inline constexpr std::size_t kBlockId = 4;
inline constexpr std::size_t kInode = 12;
inline constexpr std::size_t kOffset = 16;
inline constexpr std::size_t kCompressedSize = 20;
inline constexpr std::size_t kOriginalSize = 24;
inline constexpr std::size_t kCompression = 28;
inline constexpr std::size_t kEncryption = 29;
inline constexpr std::size_t kPayloadChecksum = 30;
inline constexpr std::size_t kTimestamp = 34;
inline constexpr std::size_t kKeyId = 42;
inline constexpr std::size_t kReserved = 50;
static_assert(kReserved + 8 == kBlockHeaderSize, "block header layout drifted");
}  // namespace block_layout

struct BlockHeader {
  uint32_t magic{kBlockMagic};
  uint64_t block_id{0};
  uint32_t inode{0};
  uint32_t offset{0};           // logical file offset of the payload
  uint32_t compressed_size{0};  // stored payload bytes
  uint32_t original_size{0};    // plaintext bytes before compression and encryption
  uint8_t compression{0};
  uint8_t encryption{0};
  uint32_t payload_checksum{0};
  uint64_t timestamp{0};
  uint64_t key_id{0};

  bool operator==(const BlockHeader&) const = default;
};

using BlockHeaderBytes = std::array<uint8_t, kBlockHeaderSize>;

BlockHeaderBytes SerializeBlockHeader(const BlockHeader& header);
BlockHeader ParseBlockHeader(std::span<const uint8_t> bytes);

struct BlockRecord {
  BlockHeader header;
  std::vector<uint8_t> payload;
};

// Fixed-size blocks laid out after the metadata region. Block ids start at 1
// and are never reused; a written block is never rewritten.
class BlockStore {
public:
  BlockStore(BackingStore& store, uint32_t block_size, uint64_t region_offset, uint64_t free_blocks);

  BlockStore(const BlockStore&) = delete;
  BlockStore& operator=(const BlockStore&) = delete;

  [[nodiscard]] std::size_t PayloadCapacity() const noexcept { return block_size_ - kBlockOverhead; }
  [[nodiscard]] uint32_t BlockSize() const noexcept { return block_size_; }
  [[nodiscard]] uint64_t RegionOffset() const noexcept { return region_offset_; }
  [[nodiscard]] uint64_t BlockOffset(uint64_t block_id) const noexcept;

  // Reserves a fresh id. Throws Error{OutOfSpace} when no free blocks remain.
  uint64_t Allocate();

  // Fills block_id, sizes, payload checksum and timestamp into |header| and
  // persists the whole block. |block_id| must come from Allocate() and not be
  // written yet. Payload larger than PayloadCapacity() is
  // Error{InvalidArgument}.
  void WriteBlock(uint64_t block_id, BlockHeader header, std::span<const uint8_t> payload);

  // Writes |payload| to a newly allocated block and returns its id.
  // |previous_id| (0 for none) is left untouched and recorded as superseded.
  uint64_t WriteBlockCow(uint64_t previous_id, BlockHeader header, std::span<const uint8_t> payload);

  // Verifies both magics and both checksums (Error{InvalidFormat}); an id not
  // written during this mount is Error{NotFound}.
  BlockRecord ReadBlock(uint64_t block_id);

  [[nodiscard]] bool IsWritten(uint64_t block_id) const;
  [[nodiscard]] std::optional<uint64_t> SuccessorOf(uint64_t block_id) const;
  [[nodiscard]] std::vector<uint64_t> WrittenBlocks() const;
  [[nodiscard]] uint64_t FreeBlocks() const noexcept { return free_blocks_.load(std::memory_order_acquire); }
  [[nodiscard]] uint64_t AllocatedCount() const noexcept { return next_block_id_.load(std::memory_order_acquire) - 1; }

private:
  BackingStore& store_;
  uint32_t block_size_;
  uint64_t region_offset_;
  std::atomic<uint64_t> next_block_id_{1};
  std::atomic<uint64_t> free_blocks_;
  std::set<uint64_t> written_;
  std::unordered_map<uint64_t, uint64_t> successors_;
  mutable std::mutex mutex_;
};

// Rounds |value| up to a multiple of |alignment| (a power of two).
constexpr uint64_t AlignUp(uint64_t value, uint64_t alignment) noexcept {
  return (value + alignment - 1) & ~(alignment - 1);
}

}  // namespace eclipsefs::storage
