#include "eclipsefs/storage/block_store.h"

#include <algorithm>
#include <string>

#include "eclipsefs/common.h"
#include "eclipsefs/core/checksum.h"
#include "eclipsefs/core/node.h"
#include "eclipsefs/error.h"
#include "eclipsefs/errors.h"
#include "eclipsefs/orchestrator/event_bus.h"

namespace eclipsefs::storage {

BlockHeaderBytes SerializeBlockHeader(const BlockHeader& header) {
  BlockHeaderBytes bytes{};
  StoreLE32(bytes, block_layout::kMagic, header.magic);
  StoreLE64(bytes, block_layout::kBlockId, header.block_id);
  StoreLE32(bytes, block_layout::kInode, header.inode);
  StoreLE32(bytes, block_layout::kOffset, header.offset);
  StoreLE32(bytes, block_layout::kCompressedSize, header.compressed_size);
  StoreLE32(bytes, block_layout::kOriginalSize, header.original_size);
  bytes[block_layout::kCompression] = header.compression;
  bytes[block_layout::kEncryption] = header.encryption;
  StoreLE32(bytes, block_layout::kPayloadChecksum, header.payload_checksum);
  StoreLE64(bytes, block_layout::kTimestamp, header.timestamp);
  StoreLE64(bytes, block_layout::kKeyId, header.key_id);
  return bytes;
}

BlockHeader ParseBlockHeader(std::span<const uint8_t> bytes) {
  if (bytes.size() < kBlockHeaderSize) {
    throw Error{ErrorDomain::InvalidFormat, errors::format::kTruncatedRecord, "Block header truncated"};
  }
  BlockHeader header;
  header.magic = LoadLE32(bytes, block_layout::kMagic);
  if (header.magic != kBlockMagic) {
    throw Error{ErrorDomain::InvalidFormat, errors::format::kBlockMagic, std::string(errors::msg::kBlockMagicMismatch)};
  }
  header.block_id = LoadLE64(bytes, block_layout::kBlockId);
  header.inode = LoadLE32(bytes, block_layout::kInode);
  header.offset = LoadLE32(bytes, block_layout::kOffset);
  header.compressed_size = LoadLE32(bytes, block_layout::kCompressedSize);
  header.original_size = LoadLE32(bytes, block_layout::kOriginalSize);
  header.compression = bytes[block_layout::kCompression];
  header.encryption = bytes[block_layout::kEncryption];
  header.payload_checksum = LoadLE32(bytes, block_layout::kPayloadChecksum);
  header.timestamp = LoadLE64(bytes, block_layout::kTimestamp);
  header.key_id = LoadLE64(bytes, block_layout::kKeyId);
  return header;
}

BlockStore::BlockStore(BackingStore& store, uint32_t block_size, uint64_t region_offset, uint64_t free_blocks)
    : store_(store), block_size_(block_size), region_offset_(region_offset), free_blocks_(free_blocks) {
  if (block_size_ <= kBlockOverhead) {
    throw Error{ErrorDomain::InvalidArgument, errors::argument::kBadBlockSize,
                "Block size " + std::to_string(block_size_) + " leaves no room for payload"};
  }
}

uint64_t BlockStore::BlockOffset(uint64_t block_id) const noexcept {
  return region_offset_ + (block_id - 1) * block_size_;
}

uint64_t BlockStore::Allocate() {
  uint64_t free = free_blocks_.load(std::memory_order_acquire);
  do {
    if (free == 0) {
      throw Error{ErrorDomain::OutOfSpace, errors::space::kNoFreeBlocks, std::string(errors::msg::kNoFreeBlocks)};
    }
  } while (!free_blocks_.compare_exchange_weak(free, free - 1, std::memory_order_acq_rel));
  return next_block_id_.fetch_add(1, std::memory_order_acq_rel);
}

void BlockStore::WriteBlock(uint64_t block_id, BlockHeader header, std::span<const uint8_t> payload) {
  if (payload.size() > PayloadCapacity()) {
    throw Error{ErrorDomain::InvalidArgument, errors::argument::kPayloadTooLarge,
                std::string(errors::msg::kBlockPayloadTooLarge) + ": " + std::to_string(payload.size()) + " > " +
                    std::to_string(PayloadCapacity())};
  }
  if (block_id == 0 || block_id >= next_block_id_.load(std::memory_order_acquire)) {
    throw Error{ErrorDomain::InvalidArgument, errors::argument::kBlockNotAllocated,
                "Block " + std::to_string(block_id) + " was never allocated"};
  }
  if (IsWritten(block_id)) {
    throw Error{ErrorDomain::InvalidOperation, errors::operation::kBlockAlreadyWritten,
                "Block " + std::to_string(block_id) + " is already written"};
  }
  header.magic = kBlockMagic;
  header.block_id = block_id;
  header.compressed_size = static_cast<uint32_t>(payload.size());
  header.payload_checksum = core::Checksum(payload);
  if (header.timestamp == 0) {
    header.timestamp = core::UnixNow();
  }

  std::vector<uint8_t> block(block_size_, 0);
  const auto header_bytes = SerializeBlockHeader(header);
  std::copy(header_bytes.begin(), header_bytes.end(), block.begin());
  std::copy(payload.begin(), payload.end(), block.begin() + kBlockHeaderSize);
  StoreLE32(block, block_size_ - kBlockFooterSize, core::Checksum(header_bytes));
  StoreLE32(block, block_size_ - sizeof(uint32_t), kBlockFooterMagic);

  try {
    store_.Write(BlockOffset(block_id), block);
  } catch (const Error& error) {
    orchestrator::PublishEvent(
        orchestrator::EventCategory::kStorage, orchestrator::EventSeverity::kError, "block_write_failed",
        error.what(),
        {orchestrator::EventField("block_id", std::to_string(block_id), orchestrator::FieldPrivacy::kPublic, true),
         orchestrator::EventField("inode", std::to_string(header.inode), orchestrator::FieldPrivacy::kPublic, true)});
    throw;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  written_.insert(block_id);
}

uint64_t BlockStore::WriteBlockCow(uint64_t previous_id, BlockHeader header, std::span<const uint8_t> payload) {
  if (payload.size() > PayloadCapacity()) {
    throw Error{ErrorDomain::InvalidArgument, errors::argument::kPayloadTooLarge,
                std::string(errors::msg::kBlockPayloadTooLarge)};
  }
  const uint64_t block_id = Allocate();
  WriteBlock(block_id, header, payload);
  if (previous_id != 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    successors_[previous_id] = block_id;
  }
  return block_id;
}

BlockRecord BlockStore::ReadBlock(uint64_t block_id) {
  if (!IsWritten(block_id)) {
    throw Error{ErrorDomain::NotFound, errors::lookup::kBlockMissing,
                "Block " + std::to_string(block_id) + " has not been written"};
  }
  auto block = store_.ReadVector(BlockOffset(block_id), block_size_);
  const std::span<const uint8_t> view(block);

  if (LoadLE32(view, block_size_ - sizeof(uint32_t)) != kBlockFooterMagic) {
    throw Error{ErrorDomain::InvalidFormat, errors::format::kBlockMagic,
                std::string(errors::msg::kBlockMagicMismatch) + " (footer)"};
  }
  const auto header_view = view.first(kBlockHeaderSize);
  if (core::Checksum(header_view) != LoadLE32(view, block_size_ - kBlockFooterSize)) {
    throw Error{ErrorDomain::InvalidFormat, errors::format::kBlockChecksum,
                std::string(errors::msg::kBlockHeaderChecksumMismatch)};
  }
  BlockRecord record;
  record.header = ParseBlockHeader(header_view);
  if (record.header.block_id != block_id || record.header.compressed_size > PayloadCapacity()) {
    throw Error{ErrorDomain::InvalidFormat, errors::format::kBlockChecksum,
                "Block header does not describe block " + std::to_string(block_id)};
  }
  const auto payload = view.subspan(kBlockHeaderSize, record.header.compressed_size);
  if (core::Checksum(payload) != record.header.payload_checksum) {
    throw Error{ErrorDomain::InvalidFormat, errors::format::kBlockChecksum,
                std::string(errors::msg::kBlockPayloadChecksumMismatch)};
  }
  record.payload.assign(payload.begin(), payload.end());
  return record;
}

bool BlockStore::IsWritten(uint64_t block_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return written_.count(block_id) != 0;
}

std::optional<uint64_t> BlockStore::SuccessorOf(uint64_t block_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = successors_.find(block_id);
  if (it == successors_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<uint64_t> BlockStore::WrittenBlocks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<uint64_t>(written_.begin(), written_.end());
}

}  // namespace eclipsefs::storage
