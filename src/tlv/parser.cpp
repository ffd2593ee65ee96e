#include "eclipsefs/tlv/parser.h"

#include <limits>

#include "eclipsefs/common.h"
#include "eclipsefs/error.h"

namespace eclipsefs::tlv {

Parser::Parser(std::span<const uint8_t> buffer, std::size_t max_records, std::size_t max_payload) {
  std::size_t offset = 0;
  std::size_t count = 0;
  while ((buffer.size() - offset) >= kRecordHeaderSize) {
    if (count >= max_records) {
      valid_ = false;
      return;
    }

    const uint16_t type = LoadLE16(buffer, offset);
    const std::size_t length = static_cast<std::size_t>(LoadLE32(buffer, offset + sizeof(uint16_t)));

    if (length > max_payload) {
      valid_ = false;
      return;
    }

    const std::size_t record_offset = offset;
    offset += kRecordHeaderSize;
    if ((buffer.size() - offset) < length) {
      valid_ = false;
      return;
    }

    records_.push_back(Record{type, buffer.subspan(offset, length), record_offset});

    offset += length;
    ++count;
  }

  valid_ = offset == buffer.size();
  consumed_ = offset;
}

Writer& Writer::Add(uint16_t type, std::span<const uint8_t> value) {
  if (value.size() > std::numeric_limits<uint32_t>::max()) {
    throw Error{ErrorDomain::InvalidArgument, errors::argument::kPayloadTooLarge,
                "TLV value exceeds 32-bit length"};
  }
  AppendLE16(buffer_, type);
  AppendLE32(buffer_, static_cast<uint32_t>(value.size()));
  buffer_.insert(buffer_.end(), value.begin(), value.end());
  return *this;
}

Writer& Writer::AddU8(uint16_t type, uint8_t value) {
  return Add(type, std::span<const uint8_t>(&value, 1));
}

Writer& Writer::AddU32(uint16_t type, uint32_t value) {
  const auto le = EncodeLE<4>(value);
  return Add(type, le);
}

Writer& Writer::AddU64(uint16_t type, uint64_t value) {
  const auto le = EncodeLE<8>(value);
  return Add(type, le);
}

}  // namespace eclipsefs::tlv
