#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

enum class HttpMethod { Get, Post, Put, Delete, Patch, Options, Head };

// Exact, case-sensitive match against the supported set.
std::optional<HttpMethod> method_from_string(std::string_view s);
const char* method_name(HttpMethod m);

using HeaderMap = std::unordered_map<std::string, std::string>;
using Bytes = std::vector<std::uint8_t>;

// Text when the content-type is text/* or mentions json, raw bytes otherwise.
using Body = std::variant<std::string, Bytes>;

struct ParsedRequest {
  HttpMethod method = HttpMethod::Get;
  std::string path;
  std::string version;
  HeaderMap headers;  // lowercase names, trimmed values
  Body body;
  bool truncated = false;

  // Case-insensitive on the name. Empty string when absent.
  std::string header(const std::string& name) const;
  bool has_header(const std::string& name) const;
  // Case-insensitive on both name and value.
  bool header_equals_ci(const std::string& name, std::string_view value) const;

  bool body_is_text() const;
  // Body as a string regardless of representation.
  std::string body_text() const;
  size_t body_size() const;
};

enum class DecodeError {
  MalformedRequestLine,
  UnsupportedMethod,
  MalformedHeader,
  ChunkedNotSupported,
  InvalidContentLength
};

const char* decode_error_reason(DecodeError e);

struct DecodeComplete {
  ParsedRequest request;
  size_t bytes_consumed = 0;
};

struct DecodeIncomplete {};

struct DecodeInvalid {
  DecodeError error;
  std::string reason;
};

using DecodeOutcome = std::variant<DecodeComplete, DecodeIncomplete, DecodeInvalid>;

// Tries to extract exactly one request from the front of buffer.
// Pure: the same buffer always yields the same outcome.
DecodeOutcome decode_request(std::string_view buffer);

inline bool is_complete(const DecodeOutcome& o) {
  return std::holds_alternative<DecodeComplete>(o);
}
inline bool is_incomplete(const DecodeOutcome& o) {
  return std::holds_alternative<DecodeIncomplete>(o);
}
inline bool is_invalid(const DecodeOutcome& o) {
  return std::holds_alternative<DecodeInvalid>(o);
}
