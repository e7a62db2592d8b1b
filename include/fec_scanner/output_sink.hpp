#pragma once
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace fec {

// Destination of one output stream (one per form type).
class OutputSink {
public:
  virtual ~OutputSink() = default;
  virtual bool write(std::string_view bytes) = 0;
  virtual bool flush() = 0;
  virtual const std::string& error() const noexcept = 0;
};

class FileSink : public OutputSink {
public:
  // Creates missing parent directories, truncates an existing file.
  explicit FileSink(std::string path);

  bool is_open() const noexcept { return open_; }
  bool write(std::string_view bytes) override;
  bool flush() override;
  const std::string& error() const noexcept override { return err_; }
  const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
  std::ofstream out_;
  bool open_{false};
  std::string err_;
};

// Appends into a caller-owned string.
class StringSink : public OutputSink {
public:
  explicit StringSink(std::string& target) : target_(target) {}
  bool write(std::string_view bytes) override { target_.append(bytes); return true; }
  bool flush() override { return true; }
  const std::string& error() const noexcept override { return err_; }

private:
  std::string& target_;
  std::string err_;
};

// Opens the sink for a form-type stream. Returns nullptr and fills `err`
// on failure. Naming policy belongs to whoever builds the factory.
using SinkFactory =
    std::function<std::unique_ptr<OutputSink>(std::string_view form_type, std::string& err)>;

// <dir>/<FORMTYPE>.csv, see stream_file_name().
SinkFactory make_directory_sink_factory(std::string dir);

// In-memory streams keyed by form type. Must outlive the factory's sinks.
class MemoryStreams {
public:
  SinkFactory factory();

  // Stream contents, empty when the stream was never opened.
  std::string get(std::string_view form_type) const;
  bool has(std::string_view form_type) const;
  const std::map<std::string, std::string, std::less<>>& all() const noexcept { return streams_; }

private:
  std::map<std::string, std::string, std::less<>> streams_;
};

}
