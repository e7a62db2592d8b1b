#include "fec_scanner/raw_record.hpp"
#include <algorithm>
#include <cstring>

namespace fec {

RawRecord::RawRecord(std::size_t cap_bytes) : buf_(cap_bytes) {}

void RawRecord::assign(std::string_view bytes, std::uint64_t index, std::uint64_t offset) {
  if (bytes.size() > buf_.size()) {
    std::size_t grow = std::max(bytes.size(), buf_.size() + buf_.size() / 2 + 1);
    buf_.resize(grow);
  }
  if (!bytes.empty()) std::memcpy(buf_.data(), bytes.data(), bytes.size());
  size_ = bytes.size();
  if (size_ > high_water_) high_water_ = size_;
  index_ = index;
  offset_ = offset;
}

void RawRecord::clear() noexcept { size_ = 0; }

void RawRecord::shrink(std::size_t keep_capacity) {
  size_ = 0;
  if (keep_capacity < buf_.size()) {
    buf_.resize(keep_capacity);
    buf_.shrink_to_fit();
  }
}

}
