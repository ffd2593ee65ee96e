#include "eclipsefs/security/zeroizer.h"

#include <atomic>

namespace eclipsefs::security {

void SecureWipe(std::span<uint8_t> data) noexcept {
  volatile uint8_t* ptr = data.data();
  for (std::size_t i = 0; i < data.size(); ++i) {
    ptr[i] = 0;
  }
#if defined(__GNUC__) || defined(__clang__)
  __asm__ __volatile__("" : : "r"(ptr) : "memory");
#endif
  std::atomic_thread_fence(std::memory_order_seq_cst);
}

} // namespace eclipsefs::security
