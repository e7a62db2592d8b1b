#include "fec_scanner/tokenizer.hpp"
#include "fec_scanner/raw_record.hpp"
#include <cstring>

namespace fec {

Tokenizer::Tokenizer(char* data, std::size_t size, char delimiter, char quote)
  : data_(data), size_(size), delim_(delimiter), quote_(quote) {}

Tokenizer::Tokenizer(RawRecord& rec, char delimiter, char quote)
  : Tokenizer(rec.data(), rec.size(), delimiter, quote) {}

bool Tokenizer::next(Token& out) {
  if (done_) {
    if (status_ == Status::Ok) status_ = Status::End;
    return false;
  }

  if (quote_ != '\0' && pos_ < size_ && data_[pos_] == quote_) {
    const std::size_t start = pos_ + 1;
    std::size_t r = start, w = start;
    while (true) {
      if (r >= size_) {
        status_ = Status::Unterminated;
        err_at_ = pos_;
        done_ = true;
        return false;
      }
      const char c = data_[r];
      if (c == quote_) {
        if (r + 1 < size_ && data_[r + 1] == quote_) { // escaped quote
          data_[w++] = quote_;
          r += 2;
          continue;
        }
        break; // closing quote
      }
      data_[w++] = c;
      ++r;
    }
    out.text = std::string_view(data_ + start, w - start);
    ++r;
    if (r >= size_) {
      done_ = true;
    } else if (data_[r] == delim_) {
      pos_ = r + 1;
    } else {
      status_ = Status::StrayQuote;
      err_at_ = r;
      done_ = true;
      return false;
    }
    out.index = count_++;
    out.quoted = true;
    return true;
  }

  if (pos_ >= size_) {
    // trailing delimiter (or empty record): one final empty field
    out.text = std::string_view();
    done_ = true;
  } else {
    const void* hit = std::memchr(data_ + pos_, delim_, size_ - pos_);
    if (hit) {
      const std::size_t end = static_cast<std::size_t>(static_cast<const char*>(hit) - data_);
      out.text = std::string_view(data_ + pos_, end - pos_);
      pos_ = end + 1;
    } else {
      out.text = std::string_view(data_ + pos_, size_ - pos_);
      pos_ = size_;
      done_ = true;
    }
  }
  out.index = count_++;
  out.quoted = false;
  return true;
}

bool Tokenizer::drain() {
  Token t;
  while (next(t)) {}
  return !failed();
}

std::string_view Tokenizer::reason() const noexcept {
  switch (status_) {
    case Status::Unterminated: return "unterminated quoted field";
    case Status::StrayQuote:   return "text after closing quote";
    default:                   return {};
  }
}

bool ends_in_open_quote(std::string_view rec, char delimiter, char quote) {
  if (quote == '\0') return false;
  std::size_t pos = 0;
  while (true) {
    if (pos < rec.size() && rec[pos] == quote) {
      std::size_t r = pos + 1;
      while (true) {
        if (r >= rec.size()) return true;
        if (rec[r] == quote) {
          if (r + 1 < rec.size() && rec[r + 1] == quote) { r += 2; continue; }
          break;
        }
        ++r;
      }
      ++r;
      // end of record, or text after the closing quote
      if (r >= rec.size() || rec[r] != delimiter) return false;
      pos = r + 1;
      continue;
    }
    const std::size_t hit = rec.find(delimiter, pos);
    if (hit == std::string_view::npos) return false;
    pos = hit + 1;
  }
}

}
