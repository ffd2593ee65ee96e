#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <span>
#include <vector>

namespace eclipsefs::storage {

// Byte-addressable storage beneath the engine (image file, device or memory).
class BackingStore {
public:
  virtual ~BackingStore() = default;

  // Fills |out| completely from |offset| or throws Error{IO}.
  virtual void ReadExact(uint64_t offset, std::span<uint8_t> out) = 0;
  virtual void Write(uint64_t offset, std::span<const uint8_t> data) = 0;
  virtual uint64_t Size() = 0;
  virtual void Flush() = 0;

  std::vector<uint8_t> ReadVector(uint64_t offset, std::size_t length) {
    std::vector<uint8_t> buffer(length);
    ReadExact(offset, buffer);
    return buffer;
  }

  // Cursor for sequential record reads. Shares the store's lack of locking.
  void Seek(uint64_t offset) noexcept { cursor_ = offset; }
  [[nodiscard]] uint64_t Tell() const noexcept { return cursor_; }
  void ReadAt(std::span<uint8_t> out) {
    ReadExact(cursor_, out);
    cursor_ += out.size();
  }

private:
  uint64_t cursor_{0};
};

class FileBackingStore final : public BackingStore {
public:
  enum class Mode { kReadOnly, kReadWrite, kCreate };

  FileBackingStore(const std::filesystem::path& path, Mode mode);
  ~FileBackingStore() override;

  FileBackingStore(const FileBackingStore&) = delete;
  FileBackingStore& operator=(const FileBackingStore&) = delete;

  void ReadExact(uint64_t offset, std::span<uint8_t> out) override;
  void Write(uint64_t offset, std::span<const uint8_t> data) override;
  uint64_t Size() override;
  void Flush() override;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
  void EnsureOpenUnlocked();

  std::filesystem::path path_;
  Mode mode_;
  std::fstream file_;
  std::mutex io_mutex_;
};

class MemoryBackingStore final : public BackingStore {
public:
  MemoryBackingStore() = default;
  explicit MemoryBackingStore(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

  void ReadExact(uint64_t offset, std::span<uint8_t> out) override;
  void Write(uint64_t offset, std::span<const uint8_t> data) override;
  uint64_t Size() override { return bytes_.size(); }
  void Flush() override {}

  // Test hooks.
  [[nodiscard]] std::vector<uint8_t>& bytes() noexcept { return bytes_; }
  void FailWritesAfter(std::size_t remaining) noexcept { writes_before_failure_ = remaining; fail_writes_ = true; }

private:
  std::vector<uint8_t> bytes_;
  bool fail_writes_{false};
  std::size_t writes_before_failure_{0};
};

}  // namespace eclipsefs::storage
