#include "eclipsefs/crypto/random.h"

#include <cerrno>
#include <cstddef>
#include <fstream>

#if defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
#include <stdlib.h>
#elif defined(__linux__) || defined(__ANDROID__)
#include <sys/random.h>
#include <unistd.h>
#endif

#include "eclipsefs/error.h"

namespace {

using eclipsefs::Error;
using eclipsefs::ErrorDomain;

void ReadFromUrandom(std::span<uint8_t> out) {
  std::ifstream urandom("/dev/urandom", std::ios::in | std::ios::binary);
  if (!urandom) {
    throw Error(ErrorDomain::Crypto, eclipsefs::errors::crypto::kEntropyUnavailable, "Failed to open /dev/urandom", errno);
  }
  urandom.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
  if (urandom.gcount() != static_cast<std::streamsize>(out.size())) {
    throw Error(ErrorDomain::Crypto, eclipsefs::errors::crypto::kEntropyUnavailable, "Failed to read sufficient entropy from /dev/urandom", errno);
  }
}

}  // namespace

namespace eclipsefs::crypto {

void SystemRandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
#if defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
  arc4random_buf(out.data(), out.size());
#elif defined(__linux__) || defined(__ANDROID__)
  std::size_t offset = 0;
  while (offset < out.size()) {
    ssize_t result = ::getrandom(out.data() + offset, out.size() - offset, 0);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == ENOSYS) {
        break; // kernel without getrandom, use /dev/urandom below
      }
      throw Error(ErrorDomain::Crypto, errors::crypto::kEntropyUnavailable, "getrandom failed", errno);
    }
    if (result == 0) {
      break;
    }
    offset += static_cast<std::size_t>(result);
  }
  if (offset < out.size()) {
    ReadFromUrandom(out.subspan(offset));
  }
#else
  ReadFromUrandom(out);
#endif
}

}  // namespace eclipsefs::crypto
