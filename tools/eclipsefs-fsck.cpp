#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "eclipsefs/core/header.h"
#include "eclipsefs/core/integrity.h"
#include "eclipsefs/error.h"
#include "eclipsefs/storage/backing_store.h"

namespace {

constexpr int kExitClean = 0;
constexpr int kExitUsage = 64;
constexpr int kExitDataErr = 65;
constexpr int kExitNoInput = 66;
constexpr int kExitIO = 74;

void PrintReport(const eclipsefs::core::IntegrityCheckResult& report, bool verbose) {
  const auto& header = report.header;
  std::cout << "Image label:      " << eclipsefs::core::HeaderLabel(header) << '\n';
  std::cout << "Inode table:      " << header.total_inodes << " entries at offset " << header.inode_table_offset
            << '\n';
  std::cout << "Nodes decoded:    " << report.nodes_checked << '\n';
  if (verbose) {
    std::cout << "  directories:    " << report.directories << '\n';
    std::cout << "  files:          " << report.files << '\n';
    std::cout << "  symlinks:       " << report.symlinks << '\n';
  }

  // Group per inode so each damaged node reads as one block.
  std::map<uint32_t, std::vector<const eclipsefs::core::IntegrityProblem*>> by_inode;
  for (const auto& problem : report.problems) {
    by_inode[problem.inode].push_back(&problem);
  }
  for (const auto& [inode, problems] : by_inode) {
    if (inode == 0) {
      std::cout << "Image:\n";
    } else {
      std::cout << "Inode " << inode << ":\n";
    }
    for (const auto* problem : problems) {
      std::cout << "  " << (problem->severity == eclipsefs::core::ProblemSeverity::kError ? "ERROR  " : "WARNING")
                << ' ' << problem->description << '\n';
    }
  }
  std::cout << report.ErrorCount() << " error(s), " << report.problems.size() - report.ErrorCount()
            << " warning(s)" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
  bool verbose = false;
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--verbose" || arg == "-v") {
      verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: eclipsefs-fsck [--verbose] <image>\n";
      return kExitClean;
    } else if (arg.rfind("--", 0) == 0) {
      std::cerr << "eclipsefs-fsck: unknown option " << arg << std::endl;
      return kExitUsage;
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.size() != 1) {
    std::cerr << "eclipsefs-fsck expects exactly one image path" << std::endl;
    return kExitUsage;
  }

  try {
    const auto image = std::filesystem::path(positional.front());
    if (!std::filesystem::exists(image)) {
      std::cerr << "eclipsefs-fsck: image not found: " << image.string() << std::endl;
      return kExitNoInput;
    }
    auto store = std::make_shared<eclipsefs::storage::FileBackingStore>(
        image, eclipsefs::storage::FileBackingStore::Mode::kReadOnly);
    const auto report = eclipsefs::core::VerifyImageIntegrity(store);
    PrintReport(report, verbose);
    return report.ok ? kExitClean : kExitDataErr;
  } catch (const eclipsefs::Error& err) {
    std::cerr << "eclipsefs-fsck failed: " << err.what() << std::endl;
    return err.domain == eclipsefs::ErrorDomain::IO ? kExitIO : kExitDataErr;
  } catch (const std::exception& ex) {
    std::cerr << "eclipsefs-fsck failed: " << ex.what() << std::endl;
    return kExitIO;
  }
}
