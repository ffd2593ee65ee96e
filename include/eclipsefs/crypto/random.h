#pragma once

#include <cstdint>
#include <span>

namespace eclipsefs::crypto {

// Fills |out| from the OS CSPRNG. Throws Error{Crypto} if no source works.
void SystemRandomBytes(std::span<uint8_t> out);

}  // namespace eclipsefs::crypto
