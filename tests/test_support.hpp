#pragma once
#include <iostream>
#include <string>
#include <string_view>

namespace fec_test {

// Collects [PASS]/[FAIL] lines; finish() turns them into the exit code.
class Checker {
public:
  bool expect(bool cond, std::string_view what) {
    ++total_;
    if (cond) {
      std::cout << "[PASS] " << what << "\n";
    } else {
      ++failed_;
      std::cout << "[FAIL] " << what << "\n";
    }
    return cond;
  }

  bool expect_eq(std::string_view got, std::string_view want, std::string_view what) {
    bool ok = got == want;
    if (!ok) std::cout << "       got:  " << printable(got) << "\n       want: " << printable(want) << "\n";
    return expect(ok, what);
  }

  template <class A, class B>
  bool expect_num(A got, B want, std::string_view what) {
    bool ok = got == static_cast<A>(want);
    if (!ok) std::cout << "       got " << got << ", want " << want << "\n";
    return expect(ok, what);
  }

  int finish(std::string_view suite) const {
    std::cout << "\n" << suite << ": total=" << total_ << " failed=" << failed_ << "\n";
    return failed_ == 0 ? 0 : 1;
  }

  static std::string printable(std::string_view s) {
    std::string out;
    for (unsigned char c : s) {
      if (c == '\n') out += "\\n";
      else if (c == '\r') out += "\\r";
      else if (c < 0x20 || c == 0x7f) {
        const char* hex = "0123456789ABCDEF";
        out += "\\x"; out += hex[c >> 4]; out += hex[c & 0xF];
      } else {
        out.push_back(static_cast<char>(c));
      }
    }
    return out;
  }

private:
  int total_{0};
  int failed_{0};
};

}
