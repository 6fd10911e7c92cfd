#pragma once
#include <cstddef>
#include <string>
#include <string_view>

// Per-connection byte accumulator: append at the back, trim at the front.
class RawBuffer {
 public:
  void append(const char* data, size_t len) { buf_.append(data, len); }
  void append(std::string_view bytes) { buf_.append(bytes.data(), bytes.size()); }

  // Drops the first n bytes (clamped to size()).
  void consume(size_t n) {
    if (n >= buf_.size()) {
      buf_.clear();
      return;
    }
    buf_.erase(0, n);
  }

  std::string_view view() const { return std::string_view(buf_); }
  size_t size() const { return buf_.size(); }
  bool empty() const { return buf_.empty(); }
  void clear() { buf_.clear(); }

 private:
  std::string buf_;
};
