#include "fec_scanner/record_reader.hpp"
#include "fec_scanner/byte_source.hpp"
#include "fec_scanner/raw_record.hpp"
#include <cstring>
#include <string_view>
#include <vector>

namespace fec {

struct RecordReader::Impl {
  ByteSource& src;
  Config cfg;
  std::vector<char> buf;
  std::size_t pos{0}, len{0};
  std::uint64_t base{0};      // source offset of buf[0]
  std::uint64_t rec_start{0}; // source offset of the record being assembled
  std::uint64_t index{0};
  std::uint64_t bytes{0};
  bool eof{false};
  bool skipping_oversize{false}; // drop until next terminator
  std::string carry;
  std::string err;

  Impl(ByteSource& s, Config c) : src(s), cfg(c) {
    if (cfg.chunk_bytes == 0) cfg.chunk_bytes = 64 * 1024;
    buf.resize(cfg.chunk_bytes);
  }

  void emit(std::string_view v, RawRecord& out) {
    if (cfg.strip_cr && !v.empty() && v.back() == '\r') v.remove_suffix(1);
    out.assign(v, ++index, rec_start);
  }

  bool fill() {
    base += len;
    pos = 0;
    len = src.read(buf.data(), buf.size());
    if (len == 0) {
      if (src.failed()) { err = src.error(); return false; }
      eof = true;
      return true;
    }
    bytes += len;
    return true;
  }

  Status next(RawRecord& out) {
    while (true) {
      if (pos >= len) {
        if (eof || !fill()) {
          if (!err.empty()) return Status::Error;
          // final record without a terminator
          if (!carry.empty()) {
            emit(carry, out);
            carry.clear();
            return Status::Record;
          }
          skipping_oversize = false;
          return Status::End;
        }
        if (pos >= len) continue;
      }

      const char* b = buf.data() + pos;
      const void* hit = std::memchr(b, cfg.terminator, len - pos);

      if (hit) {
        const std::size_t t = static_cast<std::size_t>(static_cast<const char*>(hit) - buf.data());
        std::string_view slice(b, t - pos);
        pos = t + 1;

        if (skipping_oversize) {
          skipping_oversize = false;
          rec_start = base + pos;
          continue;
        }
        if (carry.size() + slice.size() > cfg.max_record_bytes) {
          carry.clear();
          out.assign({}, ++index, rec_start);
          rec_start = base + pos;
          return Status::Oversize;
        }
        if (carry.empty()) {
          emit(slice, out);
        } else {
          carry.append(slice);
          emit(carry, out);
          carry.clear();
        }
        rec_start = base + pos;
        return Status::Record;
      }

      // unfinished record: keep it in carry unless it outgrew the guard
      std::string_view slice(b, len - pos);
      pos = len;
      if (skipping_oversize) continue;
      if (carry.size() + slice.size() > cfg.max_record_bytes) {
        carry.clear();
        skipping_oversize = true;
        out.assign({}, ++index, rec_start);
        return Status::Oversize;
      }
      carry.append(slice);
    }
  }
};

RecordReader::RecordReader(ByteSource& src)
  : RecordReader(src, Config{}) {}

RecordReader::RecordReader(ByteSource& src, Config cfg)
  : p_(new Impl(src, cfg)) {}

RecordReader::~RecordReader() { delete p_; }

RecordReader::Status RecordReader::next(RawRecord& out) { return p_->next(out); }
std::uint64_t RecordReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t RecordReader::records() const noexcept { return p_->index; }
const std::string& RecordReader::error() const noexcept { return p_->err; }

}
