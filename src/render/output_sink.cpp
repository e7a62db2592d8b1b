#include "fec_scanner/output_sink.hpp"
#include "fec_scanner/path_utils.hpp"

namespace fec {

FileSink::FileSink(std::string path) : path_(std::move(path)) {
  if (!ensure_parent_dirs(path_)) {
    err_ = "cannot create directory for " + path_;
    return;
  }
  out_.open(path_, std::ios::binary | std::ios::trunc);
  if (!out_) { err_ = "open failed: " + path_; return; }
  open_ = true;
}

bool FileSink::write(std::string_view bytes) {
  if (!open_) return false;
  out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!out_) { err_ = "write failed: " + path_; return false; }
  return true;
}

bool FileSink::flush() {
  if (!open_) return false;
  out_.flush();
  if (!out_) { err_ = "flush failed: " + path_; return false; }
  return true;
}

SinkFactory make_directory_sink_factory(std::string dir) {
  return [dir = std::move(dir)](std::string_view form_type, std::string& err) -> std::unique_ptr<OutputSink> {
    const std::string path = (std::filesystem::path(dir) / stream_file_name(form_type)).string();
    auto sink = std::make_unique<FileSink>(path);
    if (!sink->is_open()) { err = sink->error(); return nullptr; }
    return sink;
  };
}

SinkFactory MemoryStreams::factory() {
  return [this](std::string_view form_type, std::string&) -> std::unique_ptr<OutputSink> {
    auto it = streams_.find(form_type);
    if (it == streams_.end()) it = streams_.emplace(std::string(form_type), std::string()).first;
    return std::make_unique<StringSink>(it->second);
  };
}

std::string MemoryStreams::get(std::string_view form_type) const {
  auto it = streams_.find(form_type);
  return it == streams_.end() ? std::string() : it->second;
}

bool MemoryStreams::has(std::string_view form_type) const {
  return streams_.find(form_type) != streams_.end();
}

}
