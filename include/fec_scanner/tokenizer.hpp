#pragma once
#include <cstddef>
#include <string_view>

namespace fec {

class RawRecord;

// Field separators seen in filings.
constexpr char kCommaDelimiter = ',';
constexpr char kFileSeparator  = '\x1C'; // ASCII 28, used from version 6 on

struct Token {
  std::string_view text;  // borrows from the record buffer
  std::size_t index = 0;  // 0-based field position
  bool quoted = false;
};

// Pull-based field splitter over one record buffer.
//
// Quoted fields (first byte == quote) may contain the delimiter, CR and LF;
// a doubled quote inside one is unescaped in place, which is why the buffer
// is mutable. Tokens stay valid until the buffer is reused.
class Tokenizer {
public:
  enum class Status { Ok, End, Unterminated, StrayQuote };

  Tokenizer(char* data, std::size_t size, char delimiter, char quote = '"');
  Tokenizer(RawRecord& rec, char delimiter, char quote = '"');

  // Produces the next token. False at end of record or on a quoting error;
  // status() distinguishes them.
  bool next(Token& out);

  // Consumes the remaining tokens. Returns false on a quoting error.
  bool drain();

  Status status() const noexcept { return status_; }
  bool failed() const noexcept { return status_ == Status::Unterminated || status_ == Status::StrayQuote; }
  std::size_t produced() const noexcept { return count_; }

  // Short, stable description of a quoting failure ("" when none).
  std::string_view reason() const noexcept;
  // Offset in the record where the failure was detected.
  std::size_t error_offset() const noexcept { return err_at_; }

private:
  char* data_;
  std::size_t size_;
  char delim_;
  char quote_;
  std::size_t pos_{0};
  std::size_t count_{0};
  std::size_t err_at_{0};
  bool done_{false};
  Status status_{Status::Ok};
};

// True when `rec` ends inside a quoted field that Tokenizer would report as
// Unterminated, i.e. the field continues on the next physical line.
bool ends_in_open_quote(std::string_view rec, char delimiter, char quote = '"');

}
