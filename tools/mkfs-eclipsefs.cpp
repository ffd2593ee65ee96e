#include <algorithm>
#include <cerrno>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "eclipsefs/core/header.h"
#include "eclipsefs/core/image_writer.h"
#include "eclipsefs/core/node.h"
#include "eclipsefs/error.h"
#include "eclipsefs/storage/backing_store.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 64;
constexpr int kExitNoInput = 66;
constexpr int kExitCantCreate = 73;
constexpr int kExitIO = 74;

constexpr std::string_view kDefaultLabel = "Eclipse OS";

struct Options {
  std::filesystem::path image;
  std::optional<std::filesystem::path> source;
  eclipsefs::core::FormatOptions format;
  bool force{false};
  bool verbose{false};
};

void PrintUsage() {
  std::cout << "Usage: mkfs-eclipsefs [--block-size=N] [--blocks=N] [--label=L] [--from=DIR]\n"
            << "                      [--force] [--verbose] <image>\n";
}

template <typename T>
std::optional<T> ParseNumber(std::string_view value) {
  T parsed{};
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return parsed;
}

// Accepts both --name=value and --name value.
std::optional<std::string_view> OptionValue(std::string_view arg, std::string_view name, int& index, int argc,
                                            char** argv) {
  if (arg.rfind(name, 0) != 0) {
    return std::nullopt;
  }
  auto rest = arg.substr(name.size());
  if (!rest.empty() && rest.front() == '=') {
    return rest.substr(1);
  }
  if (rest.empty() && index + 1 < argc) {
    return std::string_view(argv[++index]);
  }
  return std::nullopt;
}

std::optional<Options> ParseArguments(int argc, char** argv) {
  Options options;
  options.format.label = std::string(kDefaultLabel);
  std::vector<std::string_view> positional;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "--force" || arg == "-f") {
      options.force = true;
    } else if (arg == "--verbose" || arg == "-v") {
      options.verbose = true;
    } else if (auto value = OptionValue(arg, "--block-size", i, argc, argv)) {
      auto parsed = ParseNumber<uint32_t>(*value);
      if (!parsed || *parsed < 512 || (*parsed & (*parsed - 1)) != 0) {
        std::cerr << "Block size must be a power of two of at least 512 bytes" << std::endl;
        return std::nullopt;
      }
      options.format.block_size = *parsed;
    } else if (auto value = OptionValue(arg, "--blocks", i, argc, argv)) {
      auto parsed = ParseNumber<uint64_t>(*value);
      if (!parsed || *parsed == 0) {
        std::cerr << "Block count must be a positive integer" << std::endl;
        return std::nullopt;
      }
      options.format.total_blocks = *parsed;
    } else if (auto value = OptionValue(arg, "--label", i, argc, argv)) {
      options.format.label = std::string(*value);
    } else if (auto value = OptionValue(arg, "--from", i, argc, argv)) {
      options.source = std::filesystem::path(std::string(*value));
    } else if (arg.rfind("-", 0) == 0) {
      return std::nullopt;
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.size() != 1 || positional.front().empty()) {
    return std::nullopt;
  }
  options.image = std::filesystem::path(std::string(positional.front()));
  return options;
}

std::vector<uint8_t> ReadHostFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw eclipsefs::Error{eclipsefs::ErrorDomain::IO, eclipsefs::errors::io::kOpenFailed,
                           "Failed to open " + path.string(), errno};
  }
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

uint32_t HostMode(const std::filesystem::file_status& status, uint32_t type_bits) {
  return type_bits | (static_cast<uint32_t>(status.permissions()) & 07777u);
}

// Mirrors |directory| under |parent|. Entries are visited in name order so
// that inode numbers are reproducible.
std::size_t ImportDirectory(eclipsefs::core::ImageWriter& writer, uint32_t parent,
                            const std::filesystem::path& directory, bool verbose) {
  std::filesystem::directory_iterator first(directory);
  std::filesystem::directory_iterator last;
  std::vector<std::filesystem::directory_entry> entries(first, last);
  std::sort(entries.begin(), entries.end(),
            [](const auto& lhs, const auto& rhs) { return lhs.path().filename() < rhs.path().filename(); });

  std::size_t imported = 0;
  for (const auto& entry : entries) {
    const std::string name = entry.path().filename().string();
    const auto status = entry.symlink_status();
    uint32_t inode = 0;
    if (std::filesystem::is_symlink(status)) {
      inode = writer.AddChild(parent, name,
                              eclipsefs::core::Node::MakeSymlink(std::filesystem::read_symlink(entry.path()).string()));
    } else if (std::filesystem::is_directory(status)) {
      inode = writer.AddChild(parent, name, eclipsefs::core::Node::MakeDirectory(HostMode(status, 0040000)));
      imported += ImportDirectory(writer, inode, entry.path(), verbose);
    } else if (std::filesystem::is_regular_file(status)) {
      inode = writer.AddChild(parent, name,
                              eclipsefs::core::Node::MakeFile(ReadHostFile(entry.path()), HostMode(status, 0100000)));
    } else {
      if (verbose) {
        std::cout << "  skipping special file " << entry.path().string() << '\n';
      }
      continue;
    }
    ++imported;
    if (verbose) {
      std::cout << "  [" << inode << "] " << entry.path().string() << '\n';
    }
  }
  return imported;
}

}  // namespace

int main(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage();
      return kExitOk;
    }
  }
  auto options = ParseArguments(argc, argv);
  if (!options) {
    PrintUsage();
    return kExitUsage;
  }

  try {
    if (options->source && !std::filesystem::is_directory(*options->source)) {
      std::cerr << "mkfs-eclipsefs: source directory not found: " << options->source->string() << std::endl;
      return kExitNoInput;
    }
    std::error_code ec;
    if (std::filesystem::exists(options->image, ec) && std::filesystem::file_size(options->image, ec) > 0 &&
        !options->force) {
      std::cerr << "mkfs-eclipsefs: " << options->image.string()
                << " already contains data; use --force to overwrite" << std::endl;
      return kExitCantCreate;
    }

    eclipsefs::core::ImageWriter writer;
    std::size_t imported = 0;
    if (options->source) {
      if (options->verbose) {
        std::cout << "Importing " << options->source->string() << '\n';
      }
      imported = ImportDirectory(writer, eclipsefs::core::kRootInode, *options->source, options->verbose);
    }

    eclipsefs::storage::FileBackingStore store(options->image, eclipsefs::storage::FileBackingStore::Mode::kCreate);
    const auto header = writer.Finish(store, options->format);

    std::cout << "Created EclipseFS image " << options->image.string() << '\n';
    std::cout << "  Label:        " << eclipsefs::core::HeaderLabel(header) << '\n';
    std::cout << "  Block size:   " << header.block_size << '\n';
    std::cout << "  Blocks:       " << header.total_blocks << '\n';
    std::cout << "  Inodes:       " << header.total_inodes << '\n';
    if (options->source) {
      std::cout << "  Imported:     " << imported << " entries" << '\n';
    }
    std::cout.flush();
    return kExitOk;
  } catch (const eclipsefs::Error& err) {
    std::cerr << "mkfs-eclipsefs failed: " << err.what() << std::endl;
    return err.domain == eclipsefs::ErrorDomain::IO ? kExitIO : kExitUsage;
  } catch (const std::exception& ex) {
    std::cerr << "mkfs-eclipsefs failed: " << ex.what() << std::endl;
    return kExitIO;
  }
}
