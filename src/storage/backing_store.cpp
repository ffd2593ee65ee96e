#include "eclipsefs/storage/backing_store.h"

#include <algorithm>
#include <cerrno>
#include <limits>
#include <string>

#include "eclipsefs/common.h"
#include "eclipsefs/error.h"

namespace eclipsefs::storage {

namespace {

std::streamoff ToStreamOffset(uint64_t offset) {
  if (offset > static_cast<uint64_t>(std::numeric_limits<std::streamoff>::max())) {
    throw Error{ErrorDomain::IO, errors::io::kSeekFailed, "Offset exceeds stream range"};
  }
  return static_cast<std::streamoff>(offset);
}

}  // namespace

FileBackingStore::FileBackingStore(const std::filesystem::path& path, Mode mode)
    : path_(path), mode_(mode) {
  std::lock_guard<std::mutex> lock(io_mutex_);
  EnsureOpenUnlocked();
}

FileBackingStore::~FileBackingStore() {
  std::lock_guard<std::mutex> lock(io_mutex_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

void FileBackingStore::EnsureOpenUnlocked() {
  if (file_.is_open()) {
    return;
  }
  if (mode_ == Mode::kCreate) {
    std::ofstream create(path_, std::ios::binary | std::ios::trunc);
    if (!create) {
      throw Error{ErrorDomain::IO, errors::io::kOpenFailed,
                  "Failed to create image file: " + PathToUtf8String(path_), errno};
    }
  }
  auto flags = std::ios::binary | std::ios::in;
  if (mode_ != Mode::kReadOnly) {
    flags |= std::ios::out;
  }
  file_.open(path_, flags);
  if (!file_) {
    throw Error{ErrorDomain::IO, errors::io::kOpenFailed,
                "Failed to open image file: " + PathToUtf8String(path_), errno};
  }
}

void FileBackingStore::ReadExact(uint64_t offset, std::span<uint8_t> out) {
  std::lock_guard<std::mutex> lock(io_mutex_);
  EnsureOpenUnlocked();
  file_.clear();
  file_.seekg(ToStreamOffset(offset));
  if (!file_) {
    throw Error{ErrorDomain::IO, errors::io::kSeekFailed, "Failed to seek for read", errno};
  }
  if (out.empty()) {
    return;
  }
  file_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
  if (file_.gcount() != static_cast<std::streamsize>(out.size())) {
    file_.clear();
    throw Error{ErrorDomain::IO, errors::io::kShortRead,
                "Short read at offset " + std::to_string(offset) + " (wanted " +
                    std::to_string(out.size()) + " bytes)"};
  }
}

void FileBackingStore::Write(uint64_t offset, std::span<const uint8_t> data) {
  std::lock_guard<std::mutex> lock(io_mutex_);
  if (mode_ == Mode::kReadOnly) {
    throw Error{ErrorDomain::PermissionDenied, errors::permission::kReadOnlyImage, "Image opened read-only"};
  }
  EnsureOpenUnlocked();
  file_.clear();
  file_.seekp(ToStreamOffset(offset));
  if (!file_) {
    throw Error{ErrorDomain::IO, errors::io::kSeekFailed, "Failed to seek for write", errno};
  }
  file_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!file_) {
    file_.clear();
    throw Error{ErrorDomain::IO, errors::io::kWriteFailed, "Failed to write image data", errno};
  }
}

uint64_t FileBackingStore::Size() {
  std::lock_guard<std::mutex> lock(io_mutex_);
  EnsureOpenUnlocked();
  file_.flush();
  std::error_code ec;
  const auto size = std::filesystem::file_size(path_, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kOpenFailed, "Failed to query image size", ec.value()};
  }
  return static_cast<uint64_t>(size);
}

void FileBackingStore::Flush() {
  std::lock_guard<std::mutex> lock(io_mutex_);
  if (!file_.is_open()) {
    return;
  }
  file_.flush();
  if (!file_) {
    file_.clear();
    throw Error{ErrorDomain::IO, errors::io::kFlushFailed, "Failed to flush image", errno};
  }
}

void MemoryBackingStore::ReadExact(uint64_t offset, std::span<uint8_t> out) {
  if (offset > bytes_.size() || bytes_.size() - offset < out.size()) {
    throw Error{ErrorDomain::IO, errors::io::kShortRead,
                "Short read at offset " + std::to_string(offset) + " (wanted " +
                    std::to_string(out.size()) + " bytes)"};
  }
  std::copy_n(bytes_.begin() + static_cast<std::ptrdiff_t>(offset), out.size(), out.begin());
}

void MemoryBackingStore::Write(uint64_t offset, std::span<const uint8_t> data) {
  if (fail_writes_) {
    if (writes_before_failure_ == 0) {
      throw Error{ErrorDomain::IO, errors::io::kWriteFailed, "Injected write failure"};
    }
    --writes_before_failure_;
  }
  if (offset + data.size() > bytes_.size()) {
    bytes_.resize(static_cast<std::size_t>(offset + data.size()), 0);
  }
  std::copy(data.begin(), data.end(), bytes_.begin() + static_cast<std::ptrdiff_t>(offset));
}

}  // namespace eclipsefs::storage
