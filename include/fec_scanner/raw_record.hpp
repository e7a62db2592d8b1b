#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace fec {

// Byte buffer for one record plus its position in the source. The buffer is
// reused across records; capacity only grows (or shrinks on request).
// Tokens cut from it are valid until the next assign()/clear().
class RawRecord {
public:
  explicit RawRecord(std::size_t cap_bytes = 0);

  void assign(std::string_view bytes, std::uint64_t index, std::uint64_t offset);
  void clear() noexcept;

  // Drop capacity above `keep_capacity` bytes.
  void shrink(std::size_t keep_capacity = 0);

  char*       data() noexcept { return buf_.data(); }
  const char* data() const noexcept { return buf_.data(); }
  std::size_t size() const noexcept { return size_; }
  bool        empty() const noexcept { return size_ == 0; }
  std::string_view view() const noexcept { return std::string_view(buf_.data(), size_); }

  // 1-based physical record number within the file.
  std::uint64_t index() const noexcept { return index_; }
  // Byte offset of the record's first byte in the source.
  std::uint64_t offset() const noexcept { return offset_; }

  std::size_t capacity() const noexcept { return buf_.size(); }
  std::size_t high_water() const noexcept { return high_water_; }

private:
  std::vector<char> buf_;
  std::size_t size_{0};
  std::size_t high_water_{0};
  std::uint64_t index_{0};
  std::uint64_t offset_{0};
};

}
