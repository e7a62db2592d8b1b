#pragma once
#include <cstddef>
#include <cstdio>
#include <string>
#include <utility>

namespace fec {

// Sequential, forward-only input. read() returns 0 at end of input or on
// failure; failed() tells the two apart.
class ByteSource {
public:
  virtual ~ByteSource() = default;
  virtual std::size_t read(char* buf, std::size_t n) = 0;
  virtual bool failed() const noexcept = 0;
  virtual const std::string& error() const noexcept = 0;
};

// stdio-backed file source. The file is opened on the first read.
class FileByteSource : public ByteSource {
public:
  explicit FileByteSource(std::string path);
  ~FileByteSource() override;

  FileByteSource(const FileByteSource&) = delete;
  FileByteSource& operator=(const FileByteSource&) = delete;

  std::size_t read(char* buf, std::size_t n) override;
  bool failed() const noexcept override { return failed_; }
  const std::string& error() const noexcept override { return err_; }
  const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
  std::FILE* f_{nullptr};
  bool opened_{false};
  bool failed_{false};
  std::string err_;
};

class MemoryByteSource : public ByteSource {
public:
  explicit MemoryByteSource(std::string data) : data_(std::move(data)) {}

  std::size_t read(char* buf, std::size_t n) override;
  bool failed() const noexcept override { return false; }
  const std::string& error() const noexcept override { return err_; }

private:
  std::string data_;
  std::size_t pos_{0};
  std::string err_;
};

}
