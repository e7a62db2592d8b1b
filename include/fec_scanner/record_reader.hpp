#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace fec {

class ByteSource;
class RawRecord;

// Splits a ByteSource into records on a terminator byte, one per next() call.
// Memory is bounded by chunk_bytes plus one record (max_record_bytes).
class RecordReader {
public:
  struct Config {
    std::size_t chunk_bytes      = 512 * 1024;      // 512 KiB
    std::size_t max_record_bytes = 8 * 1024 * 1024; // 8 MiB guard per record
    char        terminator       = '\n';
    bool        strip_cr         = true;            // trim trailing '\r' (CRLF)
  };

  enum class Status {
    Record,   // `out` holds the next record
    Oversize, // a record over max_record_bytes was dropped; out.index() names it
    End,      // input exhausted
    Error     // source failed; see error()
  };

  explicit RecordReader(ByteSource& src);
  RecordReader(ByteSource& src, Config cfg);
  ~RecordReader();

  RecordReader(const RecordReader&) = delete;
  RecordReader& operator=(const RecordReader&) = delete;

  Status next(RawRecord& out);

  std::uint64_t bytes_read() const noexcept;
  std::uint64_t records() const noexcept;
  const std::string& error() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
