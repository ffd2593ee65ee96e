#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace eclipsefs::security {

// Overwrites |data| with zeros in a way the optimizer cannot elide.
void SecureWipe(std::span<uint8_t> data) noexcept;

// Owned key material. Moves leave the source empty; the bytes are wiped on
// destruction and before reassignment. Copies must be explicit.
class SecretBytes {
public:
  SecretBytes() = default;
  explicit SecretBytes(std::size_t size) : bytes_(size, 0) {}
  explicit SecretBytes(std::span<const uint8_t> bytes) : bytes_(bytes.begin(), bytes.end()) {}
  ~SecretBytes() { Clear(); }

  SecretBytes(const SecretBytes&) = delete;
  SecretBytes& operator=(const SecretBytes&) = delete;

  SecretBytes(SecretBytes&& other) noexcept : bytes_(std::move(other.bytes_)) { other.bytes_.clear(); }
  SecretBytes& operator=(SecretBytes&& other) noexcept {
    if (this != &other) {
      Clear();
      bytes_ = std::move(other.bytes_);
      other.bytes_.clear();
    }
    return *this;
  }

  [[nodiscard]] SecretBytes Clone() const { return SecretBytes(view()); }

  void Clear() noexcept {
    SecureWipe(bytes_);
    bytes_.clear();
  }

  std::span<uint8_t> mutable_view() noexcept { return bytes_; }
  std::span<const uint8_t> view() const noexcept { return bytes_; }
  std::size_t size() const noexcept { return bytes_.size(); }
  bool empty() const noexcept { return bytes_.empty(); }

private:
  std::vector<uint8_t> bytes_;
};

} // namespace eclipsefs::security
