#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace eclipsefs {
  enum class ErrorDomain : std::uint16_t {
    InvalidFormat = 0x01,
    NotFound = 0x02,
    InvalidOperation = 0x03,
    InvalidArgument = 0x04,
    IO = 0x05,
    PermissionDenied = 0x06,
    OutOfSpace = 0x07,
    OutOfMemory = 0x08,
    Crypto = 0x09,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes to avoid collisions with propagated
  // platform error numbers. Codes inside the reserved range are stable.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    return static_cast<int>(domain) * kErrorDomainSpan;
  }

  inline constexpr const char* ErrorDomainName(ErrorDomain domain) noexcept {
    switch (domain) {
    case ErrorDomain::InvalidFormat:
      return "InvalidFormat";
    case ErrorDomain::NotFound:
      return "NotFound";
    case ErrorDomain::InvalidOperation:
      return "InvalidOperation";
    case ErrorDomain::InvalidArgument:
      return "InvalidArgument";
    case ErrorDomain::IO:
      return "IoError";
    case ErrorDomain::PermissionDenied:
      return "PermissionDenied";
    case ErrorDomain::OutOfSpace:
      return "OutOfSpace";
    case ErrorDomain::OutOfMemory:
      return "OutOfMemory";
    case ErrorDomain::Crypto:
      return "Crypto";
    case ErrorDomain::Internal:
      return "Internal";
    }
    return "Unknown";
  }

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace format {
      inline constexpr int kBadMagic = Make(ErrorDomain::InvalidFormat, 0x01);
      inline constexpr int kHeaderChecksum = Make(ErrorDomain::InvalidFormat, 0x02);
      inline constexpr int kTruncatedRecord = Make(ErrorDomain::InvalidFormat, 0x03);
      inline constexpr int kMalformedTlv = Make(ErrorDomain::InvalidFormat, 0x04);
      inline constexpr int kInodeMismatch = Make(ErrorDomain::InvalidFormat, 0x05);
      inline constexpr int kNodeChecksum = Make(ErrorDomain::InvalidFormat, 0x06);
      inline constexpr int kBlockChecksum = Make(ErrorDomain::InvalidFormat, 0x07);
      inline constexpr int kUnsupportedVersion = Make(ErrorDomain::InvalidFormat, 0x08);
      inline constexpr int kCiphertextTooShort = Make(ErrorDomain::InvalidFormat, 0x09);
      inline constexpr int kCorruptCompressedPayload = Make(ErrorDomain::InvalidFormat, 0x0A);
      inline constexpr int kBlockMagic = Make(ErrorDomain::InvalidFormat, 0x0B);
    } // namespace format

    namespace lookup {
      inline constexpr int kPathComponentMissing = Make(ErrorDomain::NotFound, 0x01);
      inline constexpr int kInodeMissing = Make(ErrorDomain::NotFound, 0x02);
      inline constexpr int kKeyMissing = Make(ErrorDomain::NotFound, 0x03);
      inline constexpr int kDedupEntryMissing = Make(ErrorDomain::NotFound, 0x04);
      inline constexpr int kSnapshotMissing = Make(ErrorDomain::NotFound, 0x05);
      inline constexpr int kBlockMissing = Make(ErrorDomain::NotFound, 0x06);
    } // namespace lookup

    namespace operation {
      inline constexpr int kNotADirectory = Make(ErrorDomain::InvalidOperation, 0x01);
      inline constexpr int kIsADirectory = Make(ErrorDomain::InvalidOperation, 0x02);
      inline constexpr int kAlgorithmMismatch = Make(ErrorDomain::InvalidOperation, 0x03);
      inline constexpr int kUnsupportedCompression = Make(ErrorDomain::InvalidOperation, 0x04);
      inline constexpr int kBlockAlreadyWritten = Make(ErrorDomain::InvalidOperation, 0x05);
    } // namespace operation

    namespace argument {
      inline constexpr int kPayloadTooLarge = Make(ErrorDomain::InvalidArgument, 0x01);
      inline constexpr int kWrongKeySize = Make(ErrorDomain::InvalidArgument, 0x02);
      inline constexpr int kDuplicateName = Make(ErrorDomain::InvalidArgument, 0x03);
      inline constexpr int kDuplicateInode = Make(ErrorDomain::InvalidArgument, 0x04);
      inline constexpr int kBadConfigValue = Make(ErrorDomain::InvalidArgument, 0x05);
      inline constexpr int kInvalidName = Make(ErrorDomain::InvalidArgument, 0x06);
      inline constexpr int kWrongNonceSize = Make(ErrorDomain::InvalidArgument, 0x07);
      inline constexpr int kBadBlockSize = Make(ErrorDomain::InvalidArgument, 0x08);
      inline constexpr int kBlockNotAllocated = Make(ErrorDomain::InvalidArgument, 0x09);
      inline constexpr int kMissingComponent = Make(ErrorDomain::InvalidArgument, 0x0A);
      inline constexpr int kNoCipherForAlgorithm = Make(ErrorDomain::InvalidArgument, 0x0B);
    } // namespace argument

    namespace io {
      inline constexpr int kOpenFailed = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kShortRead = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kWriteFailed = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kSeekFailed = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kFlushFailed = Make(ErrorDomain::IO, 0x05);
    } // namespace io

    namespace space {
      inline constexpr int kNoFreeBlocks = Make(ErrorDomain::OutOfSpace, 0x01);
      inline constexpr int kInodeIdsExhausted = Make(ErrorDomain::OutOfSpace, 0x02);
      inline constexpr int kRecordOffsetOverflow = Make(ErrorDomain::OutOfSpace, 0x03);
    } // namespace space

    namespace permission {
      inline constexpr int kReadOnlyImage = Make(ErrorDomain::PermissionDenied, 0x01);
    } // namespace permission

    namespace crypto {
      inline constexpr int kProviderFailure = Make(ErrorDomain::Crypto, 0x01);
      inline constexpr int kSelfTestFailed = Make(ErrorDomain::Crypto, 0x02);
      inline constexpr int kCipherUnavailable = Make(ErrorDomain::Crypto, 0x03);
      inline constexpr int kEntropyUnavailable = Make(ErrorDomain::Crypto, 0x04);
    } // namespace crypto

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          context(std::move(ctx)) {}
  };
  struct AuthenticationFailureError : public std::runtime_error {
    explicit AuthenticationFailureError(const std::string& msg) : std::runtime_error(msg) {}
  };
} // namespace eclipsefs
