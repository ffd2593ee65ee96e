#include "eclipsefs/core/integrity.h"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "eclipsefs/core/image_writer.h"
#include "eclipsefs/orchestrator/event_bus.h"
#include "eclipsefs/storage/backing_store.h"
#include "eclipsefs/storage/node_reader.h"
#include "eclipsefs/tlv/node_codec.h"

namespace {

namespace core = eclipsefs::core;
namespace storage = eclipsefs::storage;

std::shared_ptr<storage::MemoryBackingStore> Finish(const core::ImageWriter& writer) {
  auto store = std::make_shared<storage::MemoryBackingStore>();
  writer.Finish(*store, core::FormatOptions{});
  return store;
}

bool HasProblem(const core::IntegrityCheckResult& result, uint32_t inode, core::ProblemSeverity severity,
                const std::string& fragment) {
  for (const auto& problem : result.problems) {
    if (problem.inode == inode && problem.severity == severity &&
        problem.description.find(fragment) != std::string::npos) {
      return true;
    }
  }
  return false;
}

void TestCleanImage() {
  core::ImageWriter writer;
  const uint32_t bin = writer.AddChild(core::kRootInode, "bin", core::Node::MakeDirectory());
  (void)writer.AddChild(bin, "sh", core::Node::MakeFile(std::vector<uint8_t>(10, 0x7F)));
  (void)writer.AddChild(core::kRootInode, "sh", core::Node::MakeSymlink("/bin/sh"));
  const auto result = core::VerifyImageIntegrity(Finish(writer));
  assert(result.ok && result.problems.empty());
  assert(result.nodes_checked == 4 && result.directories == 2 && result.files == 1 && result.symlinks == 1);
  assert(result.header.total_inodes == 4);
}

void TestStructuralProblems() {
  core::ImageWriter writer;
  auto dir = core::Node::MakeDirectory();
  dir.children.emplace("ghost", 99);
  dir.nlink = 5;
  const uint32_t broken = writer.AddChild(core::kRootInode, "broken", dir);
  writer.AddNode(50, core::Node::MakeFile({}));

  const auto result = core::VerifyImageIntegrity(Finish(writer));
  assert(!result.ok);
  assert(HasProblem(result, broken, core::ProblemSeverity::kError, "missing inode 99"));
  assert(HasProblem(result, broken, core::ProblemSeverity::kWarning, "link count 5"));
  assert(HasProblem(result, 50, core::ProblemSeverity::kError, "not reachable"));
  assert(result.ErrorCount() == 2);
}

void TestCorruptRecord() {
  core::ImageWriter writer;
  const uint32_t file = writer.AddChild(core::kRootInode, "data", core::Node::MakeFile(std::vector<uint8_t>(32, 1)));
  auto store = Finish(writer);
  {
    storage::NodeReader layout(store, storage::MakeNodeCache(storage::CacheStrategy::kLru, 4));
    const auto offset = *layout.inode_table().AbsoluteOffset(file);
    store->bytes()[offset + eclipsefs::tlv::kNodeRecordHeaderSize + 7 + 6] ^= 0x02;
  }
  const auto result = core::VerifyImageIntegrity(store);
  assert(!result.ok && result.nodes_checked == 1);
  assert(result.ErrorCount() == 1 && result.problems[0].inode == file);
  eclipsefs::orchestrator::ResetEventBusForTesting();
}

void TestDamagedHeader() {
  core::ImageWriter writer;
  auto store = Finish(writer);
  store->bytes()[0] = 'X';
  const auto result = core::VerifyImageIntegrity(store);
  assert(!result.ok && result.problems.size() == 1 && result.problems[0].inode == 0);
  assert(result.nodes_checked == 0);
}

}  // namespace

int main() {
  TestCleanImage();
  TestStructuralProblems();
  TestCorruptRecord();
  TestDamagedHeader();
  std::cout << "integrity tests ok\n";
  return 0;
}
