#include "eclipsefs/storage/node_cache.h"

#include <cctype>
#include <string>

namespace eclipsefs::storage {

const char* CacheStrategyName(CacheStrategy strategy) noexcept {
  switch (strategy) {
  case CacheStrategy::kLru:
    return "lru";
  case CacheStrategy::kArc:
    return "arc";
  }
  return "unknown";
}

std::optional<CacheStrategy> ParseCacheStrategy(std::string_view text) {
  std::string lowered;
  lowered.reserve(text.size());
  for (char c : text) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lowered == "lru") {
    return CacheStrategy::kLru;
  }
  if (lowered == "arc" || lowered == "adaptive") {
    return CacheStrategy::kArc;
  }
  return std::nullopt;
}

std::unique_ptr<NodeCache> MakeNodeCache(CacheStrategy strategy, std::size_t capacity) {
  switch (strategy) {
  case CacheStrategy::kLru:
    return std::make_unique<LruNodeCache>(capacity);
  case CacheStrategy::kArc:
    break;
  }
  return std::make_unique<ArcNodeCache>(capacity);
}

}  // namespace eclipsefs::storage
