#include "eclipsefs/storage/node_reader.h"

#include <algorithm>
#include <array>
#include <string>
#include <vector>

#include "eclipsefs/error.h"
#include "eclipsefs/errors.h"
#include "eclipsefs/orchestrator/event_bus.h"
#include "eclipsefs/tlv/node_codec.h"

namespace eclipsefs::storage {

namespace {

void ReportDecodeFailure(uint32_t inode, const Error& error) {
  const bool checksum = error.code == errors::format::kNodeChecksum;
  orchestrator::PublishEvent(
      orchestrator::EventCategory::kSecurity, orchestrator::EventSeverity::kError,
      checksum ? "checksum_mismatch" : "node_decode_failed", error.what(),
      {orchestrator::EventField("inode", std::to_string(inode), orchestrator::FieldPrivacy::kPublic, true),
       orchestrator::EventField("code", std::to_string(error.code), orchestrator::FieldPrivacy::kPublic, true)});
}

}  // namespace

std::vector<std::string_view> SplitPath(std::string_view path) {
  std::vector<std::string_view> components;
  std::size_t start = 0;
  while (start <= path.size()) {
    const std::size_t slash = path.find('/', start);
    const std::size_t end = slash == std::string_view::npos ? path.size() : slash;
    auto component = path.substr(start, end - start);
    if (!component.empty() && component != ".") {
      components.push_back(component);
    }
    if (slash == std::string_view::npos) {
      break;
    }
    start = slash + 1;
  }
  return components;
}

NodeReader::NodeReader(std::shared_ptr<BackingStore> store, std::unique_ptr<NodeCache> cache)
    : store_(std::move(store)), cache_(std::move(cache)) {
  if (!store_ || !cache_) {
    throw Error{ErrorDomain::InvalidArgument, errors::argument::kMissingComponent, "NodeReader requires a store and a cache"};
  }
  core::HeaderBytes header_bytes{};
  store_->ReadExact(0, header_bytes);
  header_ = core::ParseHeader(header_bytes);

  auto table_bytes = store_->ReadVector(header_.inode_table_offset,
                                        static_cast<std::size_t>(header_.inode_table_size));
  table_ = core::InodeTable::Parse(header_, table_bytes);
}

NodePtr NodeReader::ReadNode(uint32_t inode) {
  if (auto cached = cache_->Get(inode)) {
    return cached;
  }
  if (auto it = committed_.find(inode); it != committed_.end()) {
    cache_->Put(inode, it->second);
    return it->second;
  }
  auto node = LoadFromDisk(inode);
  cache_->Put(inode, node);
  return node;
}

NodePtr NodeReader::LoadFromDisk(uint32_t inode) {
  const auto offset = table_.AbsoluteOffset(inode);
  if (!offset) {
    throw Error{ErrorDomain::NotFound, errors::lookup::kInodeMissing,
                "Inode " + std::to_string(inode) + " not present in inode table"};
  }
  try {
    std::array<uint8_t, tlv::kNodeRecordHeaderSize> record_header{};
    store_->Seek(*offset);
    store_->ReadAt(record_header);
    const auto header = tlv::ParseNodeRecordHeader(record_header);
    if (header.inode != inode) {
      throw Error{ErrorDomain::InvalidFormat, errors::format::kInodeMismatch,
                  std::string(errors::msg::kInodeMismatch) + ": table " + std::to_string(inode) +
                      ", record " + std::to_string(header.inode)};
    }
    const uint64_t image_size = store_->Size();
    if (*offset > image_size || header.record_size > image_size - *offset) {
      throw Error{ErrorDomain::InvalidFormat, errors::format::kTruncatedRecord,
                  "Node record for inode " + std::to_string(inode) + " claims " +
                      std::to_string(header.record_size) + " bytes past the end of the image"};
    }
    std::vector<uint8_t> payload(header.record_size - tlv::kNodeRecordHeaderSize);
    store_->ReadAt(payload);
    return std::make_shared<const core::Node>(tlv::DecodeNode(payload, inode));
  } catch (Error& error) {
    error.context.push_back("node record for inode " + std::to_string(inode) + " at offset " +
                            std::to_string(*offset));
    if (error.domain == ErrorDomain::InvalidFormat) {
      ReportDecodeFailure(inode, error);
    }
    throw;
  }
}

uint32_t NodeReader::LookupPath(std::string_view path) {
  uint32_t current = core::kRootInode;
  for (auto component : SplitPath(path)) {
    auto node = ReadNode(current);
    if (!node->IsDirectory()) {
      throw Error{ErrorDomain::InvalidOperation, errors::operation::kNotADirectory,
                  std::string(errors::msg::kNotADirectory) + ": " + std::string(path)};
    }
    auto child = node->children.find(std::string(component));
    if (child == node->children.end()) {
      throw Error{ErrorDomain::NotFound, errors::lookup::kPathComponentMissing,
                  "No such entry '" + std::string(component) + "' in " + std::string(path)};
    }
    current = child->second;
  }
  return current;
}

std::size_t NodeReader::PrefetchDirectory(uint32_t inode) noexcept {
  std::size_t loaded = 0;
  try {
    auto directory = ReadNode(inode);
    if (!directory->IsDirectory()) {
      return 0;
    }
    for (const auto& [name, child] : directory->children) {
      if (cache_->Contains(child)) {
        continue;
      }
      try {
        (void)ReadNode(child);
        ++loaded;
      } catch (const std::exception& ex) {
        orchestrator::PublishEvent(
            orchestrator::EventCategory::kStorage, orchestrator::EventSeverity::kDebug,
            "prefetch_failed", ex.what(),
            {orchestrator::EventField("inode", std::to_string(child), orchestrator::FieldPrivacy::kPublic, true)});
      }
    }
  } catch (const std::exception& ex) {
    orchestrator::PublishEvent(
        orchestrator::EventCategory::kStorage, orchestrator::EventSeverity::kDebug, "prefetch_failed",
        ex.what(),
        {orchestrator::EventField("inode", std::to_string(inode), orchestrator::FieldPrivacy::kPublic, true)});
  }
  return loaded;
}

void NodeReader::CommitNode(uint32_t inode, core::Node node) {
  auto shared = std::make_shared<const core::Node>(std::move(node));
  committed_[inode] = shared;
  cache_->Put(inode, std::move(shared));
}

bool NodeReader::Exists(uint32_t inode) const {
  return committed_.count(inode) != 0 || table_.Contains(inode);
}

uint32_t NodeReader::MaxInode() const noexcept {
  uint32_t max_inode = table_.MaxInode();
  for (const auto& [inode, node] : committed_) {
    max_inode = std::max(max_inode, inode);
  }
  return max_inode;
}

std::size_t NodeReader::InodeCount() const noexcept {
  std::size_t count = table_.size();
  for (const auto& [inode, node] : committed_) {
    if (!table_.Contains(inode)) {
      ++count;
    }
  }
  return count;
}

std::vector<uint32_t> NodeReader::KnownInodes() const {
  std::vector<uint32_t> inodes;
  inodes.reserve(InodeCount());
  for (const auto& entry : table_.entries()) {
    inodes.push_back(entry.inode);
  }
  for (const auto& [inode, node] : committed_) {
    if (!table_.Contains(inode)) {
      inodes.push_back(inode);
    }
  }
  std::sort(inodes.begin(), inodes.end());
  return inodes;
}

}  // namespace eclipsefs::storage
