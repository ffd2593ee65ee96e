#include <charconv>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "eclipsefs/core/integrity.h"
#include "eclipsefs/error.h"
#include "eclipsefs/orchestrator/engine.h"
#include "eclipsefs/orchestrator/engine_config.h"
#include "eclipsefs/orchestrator/event_bus.h"
#include "eclipsefs/storage/backing_store.h"

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 64;
  constexpr int kExitDataErr = 65;
  constexpr int kExitNoInput = 66;
  constexpr int kExitIO = 74;

  void PrintUsage() {
    std::cerr << "EclipseFS image inspector\n";
    std::cerr << "Usage:\n";
    std::cerr << "  eclipsefs [--cache=lru|arc] info  <image>\n";
    std::cerr << "  eclipsefs [--cache=lru|arc] ls    <image> [path]\n";
    std::cerr << "  eclipsefs [--cache=lru|arc] cat   <image> <path>\n";
    std::cerr << "  eclipsefs [--cache=lru|arc] tree  [--depth=N] <image>\n";
    std::cerr << "  eclipsefs [--cache=lru|arc] check <image>\n";
    std::cerr << "  eclipsefs [--cache=lru|arc] stats <image>\n";
  }

  bool ValidateNoEmbeddedNull(std::string_view value, std::string_view description) {
    if (value.find('\0') != std::string_view::npos) {
      std::cerr << "Validation error: " << description << " contains embedded NUL byte." << std::endl;
      return false;
    }
    return true;
  }

  bool TryParsePathArgument(std::string_view raw, std::filesystem::path& out, std::string_view description) {
    if (!ValidateNoEmbeddedNull(raw, description)) {
      return false;
    }
    if (raw.empty()) {
      std::cerr << "Validation error: " << description << " is required." << std::endl;
      return false;
    }
    out = std::filesystem::path(std::string(raw));
    return true;
  }

  std::string_view DomainPrefix(eclipsefs::ErrorDomain domain) {
    switch (domain) {
    case eclipsefs::ErrorDomain::InvalidFormat:
      return "Format error";
    case eclipsefs::ErrorDomain::NotFound:
      return "Not found";
    case eclipsefs::ErrorDomain::InvalidOperation:
      return "Invalid operation";
    case eclipsefs::ErrorDomain::InvalidArgument:
      return "Validation error";
    case eclipsefs::ErrorDomain::IO:
      return "I/O error";
    case eclipsefs::ErrorDomain::PermissionDenied:
      return "Permission denied";
    case eclipsefs::ErrorDomain::OutOfSpace:
      return "Out of space";
    case eclipsefs::ErrorDomain::OutOfMemory:
      return "Out of memory";
    case eclipsefs::ErrorDomain::Crypto:
      return "Cryptography error";
    case eclipsefs::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  int ExitCodeFor(const eclipsefs::Error& err) {
    switch (err.domain) {
    case eclipsefs::ErrorDomain::InvalidFormat:
      return kExitDataErr;
    case eclipsefs::ErrorDomain::NotFound:
      return kExitNoInput;
    case eclipsefs::ErrorDomain::InvalidArgument:
    case eclipsefs::ErrorDomain::InvalidOperation:
      return kExitUsage;
    case eclipsefs::ErrorDomain::IO:
    default:
      return kExitIO;
    }
  }

  void ReportError(const eclipsefs::Error& err) {
    std::cerr << DomainPrefix(err.domain) << ": " << err.what() << '\n';

    std::vector<eclipsefs::orchestrator::EventField> fields;
    fields.emplace_back("domain", std::string(eclipsefs::ErrorDomainName(err.domain)));
    fields.emplace_back("code", std::to_string(err.code), eclipsefs::orchestrator::FieldPrivacy::kPublic, true);
    if (err.native_code.has_value()) {
      fields.emplace_back("native_code", std::to_string(*err.native_code),
                          eclipsefs::orchestrator::FieldPrivacy::kPublic, true);
    }
    try {
      eclipsefs::orchestrator::PublishEvent(eclipsefs::orchestrator::EventCategory::kDiagnostics,
                                            eclipsefs::orchestrator::EventSeverity::kError, "cli_error",
                                            err.what(), std::move(fields));
    } catch (const std::exception& publish_error) {
      std::clog << "{\"event\":\"eventbus_error\",\"message\":\"error report publish failed\",\"detail\":\""
                << publish_error.what() << "\"}" << std::endl;
    }
  }

  std::string FormatMode(const eclipsefs::core::Node& node) {
    std::string out;
    switch (node.kind) {
    case eclipsefs::core::NodeKind::Directory:
      out.push_back('d');
      break;
    case eclipsefs::core::NodeKind::Symlink:
      out.push_back('l');
      break;
    case eclipsefs::core::NodeKind::File:
      out.push_back('-');
      break;
    }
    constexpr std::string_view kBits = "rwxrwxrwx";
    for (int i = 0; i < 9; ++i) {
      out.push_back((node.mode & (0400u >> i)) != 0 ? kBits[static_cast<std::size_t>(i)] : '-');
    }
    return out;
  }

  std::string FeatureList(uint64_t features) {
    namespace f = eclipsefs::core::features;
    std::ostringstream out;
    const std::pair<uint64_t, const char*> kNames[] = {
        {f::kCopyOnWrite, "cow"},   {f::kChecksums, "checksums"},     {f::kEncryption, "encryption"},
        {f::kSnapshots, "snapshots"}, {f::kCompression, "compression"}, {f::kDedup, "dedup"}};
    bool first = true;
    for (const auto& [bit, name] : kNames) {
      if ((features & bit) != 0) {
        out << (first ? "" : ",") << name;
        first = false;
      }
    }
    return first ? "none" : out.str();
  }

  std::unique_ptr<eclipsefs::orchestrator::Engine> OpenImage(const std::filesystem::path& image,
                                                             eclipsefs::orchestrator::EngineConfig config) {
    return eclipsefs::orchestrator::Engine::Open(image, std::move(config), /*read_only=*/true);
  }

  int HandleInfo(eclipsefs::orchestrator::Engine& engine) {
    const auto& header = engine.Header();
    std::cout << "Magic:            " << std::string(header.magic.begin(), header.magic.end()) << '\n';
    std::cout << "Label:            " << eclipsefs::core::HeaderLabel(header) << '\n';
    std::cout << "Version:          0x" << std::hex << std::setw(8) << std::setfill('0') << header.version
              << std::dec << std::setfill(' ') << '\n';
    std::cout << "Block size:       " << header.block_size << '\n';
    std::cout << "Total blocks:     " << header.total_blocks << '\n';
    std::cout << "Free blocks:      " << header.free_blocks << '\n';
    std::cout << "Inode table:      offset " << header.inode_table_offset << ", " << header.inode_table_size
              << " bytes, " << header.total_inodes << " inodes\n";
    std::cout << "Features:         " << FeatureList(header.features) << '\n';
    std::cout << "Created:          " << header.timestamp << '\n';
    std::cout << "Header checksum:  0x" << std::hex << std::setw(8) << std::setfill('0')
              << header.header_checksum << std::dec << std::setfill(' ') << std::endl;
    return kExitOk;
  }

  int HandleList(eclipsefs::orchestrator::Engine& engine, std::string_view path) {
    const uint32_t inode = engine.LookupPath(path);
    auto node = engine.ReadNode(inode);
    if (!node->IsDirectory()) {
      std::cout << FormatMode(*node) << ' ' << std::setw(10) << node->size << ' ' << path << '\n';
      return kExitOk;
    }
    for (const auto& [name, child_inode] : node->children) {
      auto child = engine.ReadNode(child_inode);
      std::cout << FormatMode(*child) << ' ' << std::setw(3) << child->nlink << ' ' << std::setw(5) << child->uid
                << ' ' << std::setw(5) << child->gid << ' ' << std::setw(10) << child->size << ' ' << name;
      if (child->IsSymlink()) {
        std::cout << " -> " << std::string(child->data.begin(), child->data.end());
      }
      std::cout << '\n';
    }
    std::cout.flush();
    return kExitOk;
  }

  int HandleCat(eclipsefs::orchestrator::Engine& engine, std::string_view path) {
    const uint32_t inode = engine.LookupPath(path);
    const auto stat = engine.Stat(inode);
    const auto content = engine.Read(inode, 0, static_cast<std::size_t>(stat.size));
    std::cout.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    std::cout.flush();
    return std::cout ? kExitOk : kExitIO;
  }

  void PrintTree(eclipsefs::orchestrator::Engine& engine, uint32_t inode, const std::string& indent,
                 std::size_t depth, std::optional<std::size_t> max_depth) {
    auto node = engine.ReadNode(inode);
    if (max_depth && depth >= *max_depth) {
      return;
    }
    std::size_t remaining = node->children.size();
    for (const auto& [name, child_inode] : node->children) {
      const bool last = --remaining == 0;
      auto child = engine.ReadNode(child_inode);
      std::cout << indent << (last ? "`-- " : "|-- ") << name << (child->IsDirectory() ? "/" : "") << '\n';
      if (child->IsDirectory()) {
        PrintTree(engine, child_inode, indent + (last ? "    " : "|   "), depth + 1, max_depth);
      }
    }
  }

  int HandleTree(eclipsefs::orchestrator::Engine& engine, std::optional<std::size_t> max_depth) {
    std::cout << "/\n";
    PrintTree(engine, eclipsefs::core::kRootInode, "", 0, max_depth);
    std::cout.flush();
    return kExitOk;
  }

  int HandleCheck(const std::filesystem::path& image) {
    auto store = std::make_shared<eclipsefs::storage::FileBackingStore>(
        image, eclipsefs::storage::FileBackingStore::Mode::kReadOnly);
    const auto report = eclipsefs::core::VerifyImageIntegrity(store);
    std::cout << "Nodes checked:    " << report.nodes_checked << " (" << report.directories << " directories, "
              << report.files << " files, " << report.symlinks << " symlinks)\n";
    for (const auto& problem : report.problems) {
      std::cout << (problem.severity == eclipsefs::core::ProblemSeverity::kError ? "  error" : "  warning");
      if (problem.inode != 0) {
        std::cout << " [inode " << problem.inode << "]";
      }
      std::cout << ": " << problem.description << '\n';
    }
    std::cout << (report.ok ? "Image is consistent." : "Image has errors.") << std::endl;
    return report.ok ? kExitOk : kExitDataErr;
  }

  void WalkAll(eclipsefs::orchestrator::Engine& engine, uint32_t inode, std::size_t& visited) {
    auto node = engine.ReadNode(inode);
    ++visited;
    for (const auto& [name, child_inode] : node->children) {
      (void)name;
      WalkAll(engine, child_inode, visited);
    }
  }

  int HandleStats(eclipsefs::orchestrator::Engine& engine) {
    std::size_t visited = 0;
    WalkAll(engine, eclipsefs::core::kRootInode, visited);
    // Second pass measures the warm cache.
    std::size_t revisited = 0;
    WalkAll(engine, eclipsefs::core::kRootInode, revisited);

    const auto stats = engine.Stats();
    std::cout << "Nodes walked:     " << visited << '\n';
    std::cout << "Cache strategy:   " << eclipsefs::storage::CacheStrategyName(engine.Config().cache_strategy)
              << '\n';
    std::cout << "Cache entries:    " << stats.cache.size << " / " << stats.cache.capacity << '\n';
    std::cout << "Cache hits:       " << stats.cache.hits << '\n';
    std::cout << "Cache misses:     " << stats.cache.misses << '\n';
    std::cout << "Cache hit rate:   " << std::fixed << std::setprecision(1) << stats.cache.HitRate() * 100.0
              << "%\n";
    std::cout << "Encrypted ops:    " << stats.encryption.total_encrypted << '\n';
    std::cout << "Decrypted ops:    " << stats.encryption.total_decrypted << '\n';
    std::cout << "Key rotations:    " << stats.encryption.key_rotations << '\n';
    std::cout << "Blocks allocated: " << stats.blocks_allocated << '\n';
    std::cout << "Free blocks:      " << stats.free_blocks << std::endl;
    return kExitOk;
  }

  std::optional<std::size_t> ParseDepth(std::string_view value) {
    std::size_t parsed = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
      return std::nullopt;
    }
    return parsed;
  }

} // namespace

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      PrintUsage();
      return kExitUsage;
    }

    auto config = eclipsefs::orchestrator::EngineConfig::FromEnvironment();
    int index = 1;
    for (; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg.rfind("--", 0) != 0) {
        break;
      }
      if (arg == "--help") {
        PrintUsage();
        return kExitOk;
      }
      if (arg.rfind("--cache=", 0) == 0) {
        auto strategy = eclipsefs::storage::ParseCacheStrategy(arg.substr(std::string_view("--cache=").size()));
        if (!strategy) {
          PrintUsage();
          return kExitUsage;
        }
        config.cache_strategy = *strategy;
        continue;
      }
      PrintUsage();
      return kExitUsage;
    }

    if (index >= argc) {
      PrintUsage();
      return kExitUsage;
    }
    const std::string cmd = argv[index++];

    std::optional<std::size_t> max_depth;
    std::vector<std::string_view> positional;
    for (int i = index; i < argc; ++i) {
      std::string_view arg = argv[i];
      if (cmd == "tree" && arg.rfind("--depth=", 0) == 0) {
        max_depth = ParseDepth(arg.substr(std::string_view("--depth=").size()));
        if (!max_depth) {
          PrintUsage();
          return kExitUsage;
        }
        continue;
      }
      if (cmd == "tree" && arg == "--depth" && i + 1 < argc) {
        max_depth = ParseDepth(argv[++i]);
        if (!max_depth) {
          PrintUsage();
          return kExitUsage;
        }
        continue;
      }
      positional.push_back(arg);
    }
    if (positional.empty()) {
      PrintUsage();
      return kExitUsage;
    }

    std::filesystem::path image_path;
    if (!TryParsePathArgument(positional.front(), image_path, "image path")) {
      PrintUsage();
      return kExitUsage;
    }
    if (!std::filesystem::exists(image_path)) {
      std::cerr << "Not found: " << image_path.string() << std::endl;
      return kExitNoInput;
    }

    if (cmd == "check") {
      if (positional.size() != 1) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleCheck(image_path);
    }

    if (cmd == "info" || cmd == "tree" || cmd == "stats") {
      if (positional.size() != 1) {
        PrintUsage();
        return kExitUsage;
      }
      auto engine = OpenImage(image_path, config);
      if (cmd == "info") {
        return HandleInfo(*engine);
      }
      if (cmd == "tree") {
        return HandleTree(*engine, max_depth);
      }
      return HandleStats(*engine);
    }
    if (cmd == "ls" || cmd == "cat") {
      if (positional.size() > 2 || (cmd == "cat" && positional.size() != 2)) {
        PrintUsage();
        return kExitUsage;
      }
      const std::string_view path = positional.size() == 2 ? positional[1] : std::string_view("/");
      if (!ValidateNoEmbeddedNull(path, "image path argument")) {
        return kExitUsage;
      }
      auto engine = OpenImage(image_path, config);
      return cmd == "ls" ? HandleList(*engine, path) : HandleCat(*engine, path);
    }

    PrintUsage();
    return kExitUsage;
  } catch (const eclipsefs::AuthenticationFailureError& err) {
    std::cerr << "Authentication failed: " << err.what() << std::endl;
    return kExitDataErr;
  } catch (const eclipsefs::Error& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << "I/O error: " << err.what() << std::endl;
    return kExitIO;
  }
}
