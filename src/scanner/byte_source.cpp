#include "fec_scanner/byte_source.hpp"
#include <cerrno>
#include <cstring>

namespace fec {

FileByteSource::FileByteSource(std::string path) : path_(std::move(path)) {}

FileByteSource::~FileByteSource() {
  if (f_) std::fclose(f_);
}

std::size_t FileByteSource::read(char* buf, std::size_t n) {
  if (failed_) return 0;
  if (!opened_) {
    opened_ = true;
    f_ = std::fopen(path_.c_str(), "rb");
    if (!f_) {
      failed_ = true;
      err_ = "open failed: " + path_ + ": " + std::strerror(errno);
      return 0;
    }
  }
  if (!f_ || n == 0) return 0;
  std::size_t got = std::fread(buf, 1, n, f_);
  if (got == 0 && std::ferror(f_)) {
    failed_ = true;
    err_ = "read failed: " + path_ + ": " + std::strerror(errno);
  }
  return got;
}

std::size_t MemoryByteSource::read(char* buf, std::size_t n) {
  std::size_t left = data_.size() - pos_;
  if (n > left) n = left;
  if (n) std::memcpy(buf, data_.data() + pos_, n);
  pos_ += n;
  return n;
}

}
