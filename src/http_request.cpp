#include "http_request.hpp"

#include <cctype>
#include <limits>
#include <utility>

static constexpr std::string_view kCrlf = "\r\n";
static constexpr std::string_view kHeaderTerminator = "\r\n\r\n";

static std::string to_lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out)
    c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
  return out;
}

static std::string_view trim(std::string_view s) {
  size_t a = 0, b = s.size();
  while (a < b && ::isspace(static_cast<unsigned char>(s[a]))) ++a;
  while (b > a && ::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
  return s.substr(a, b - a);
}

// Splits on every occurrence of sep; empty fields are kept.
static std::vector<std::string_view> split(std::string_view s,
                                           std::string_view sep) {
  std::vector<std::string_view> out;
  size_t start = 0;
  while (true) {
    size_t pos = s.find(sep, start);
    if (pos == std::string_view::npos) {
      out.push_back(s.substr(start));
      return out;
    }
    out.push_back(s.substr(start, pos - start));
    start = pos + sep.size();
  }
}

// Leading-digit base-10 parse: optional sign, at least one digit, anything
// after the digits is ignored. nullopt when there are no digits. A value too
// large for long long saturates, so it reads as "more than will ever arrive".
static std::optional<long long> parse_content_length(std::string_view s) {
  size_t i = 0;
  bool negative = false;
  if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
    negative = s[i] == '-';
    ++i;
  }
  size_t digits_start = i;
  long long v = 0;
  constexpr long long kMax = std::numeric_limits<long long>::max();
  while (i < s.size() && ::isdigit(static_cast<unsigned char>(s[i]))) {
    int d = s[i] - '0';
    v = v > (kMax - d) / 10 ? kMax : v * 10 + d;
    ++i;
  }
  if (i == digits_start) return std::nullopt;
  return negative ? -v : v;
}

static DecodeOutcome invalid(DecodeError e) {
  return DecodeInvalid{e, decode_error_reason(e)};
}

static bool is_text_content_type(const std::string& content_type) {
  return content_type.rfind("text/", 0) == 0 ||
         content_type.find("json") != std::string::npos;
}

std::optional<HttpMethod> method_from_string(std::string_view s) {
  if (s == "GET") return HttpMethod::Get;
  if (s == "POST") return HttpMethod::Post;
  if (s == "PUT") return HttpMethod::Put;
  if (s == "DELETE") return HttpMethod::Delete;
  if (s == "PATCH") return HttpMethod::Patch;
  if (s == "OPTIONS") return HttpMethod::Options;
  if (s == "HEAD") return HttpMethod::Head;
  return std::nullopt;
}

const char* method_name(HttpMethod m) {
  switch (m) {
    case HttpMethod::Get: return "GET";
    case HttpMethod::Post: return "POST";
    case HttpMethod::Put: return "PUT";
    case HttpMethod::Delete: return "DELETE";
    case HttpMethod::Patch: return "PATCH";
    case HttpMethod::Options: return "OPTIONS";
    case HttpMethod::Head: return "HEAD";
  }
  return "GET";
}

const char* decode_error_reason(DecodeError e) {
  switch (e) {
    case DecodeError::MalformedRequestLine: return "malformed request line";
    case DecodeError::UnsupportedMethod: return "unsupported method";
    case DecodeError::MalformedHeader: return "malformed header";
    case DecodeError::ChunkedNotSupported: return "chunked not supported";
    case DecodeError::InvalidContentLength: return "invalid content-length";
  }
  return "bad request";
}

std::string ParsedRequest::header(const std::string& name) const {
  auto it = headers.find(to_lower(name));
  return it == headers.end() ? std::string() : it->second;
}

bool ParsedRequest::has_header(const std::string& name) const {
  return headers.find(to_lower(name)) != headers.end();
}

bool ParsedRequest::header_equals_ci(const std::string& name,
                                     std::string_view value) const {
  auto it = headers.find(to_lower(name));
  return it != headers.end() && to_lower(it->second) == to_lower(value);
}

bool ParsedRequest::body_is_text() const {
  return std::holds_alternative<std::string>(body);
}

std::string ParsedRequest::body_text() const {
  if (auto* s = std::get_if<std::string>(&body)) return *s;
  const auto& b = std::get<Bytes>(body);
  return std::string(b.begin(), b.end());
}

size_t ParsedRequest::body_size() const {
  if (auto* s = std::get_if<std::string>(&body)) return s->size();
  return std::get<Bytes>(body).size();
}

DecodeOutcome decode_request(std::string_view buffer) {
  size_t header_end = buffer.find(kHeaderTerminator);
  if (header_end == std::string_view::npos) return DecodeIncomplete{};

  auto lines = split(buffer.substr(0, header_end), kCrlf);

  // METHOD SP PATH SP VERSION, single spaces only
  auto parts = split(lines[0], " ");
  if (parts.size() != 3) return invalid(DecodeError::MalformedRequestLine);

  auto method = method_from_string(parts[0]);
  if (!method) return invalid(DecodeError::UnsupportedMethod);

  ParsedRequest req;
  req.method = *method;
  req.path = std::string(parts[1]);
  req.version = std::string(parts[2]);

  for (size_t i = 1; i < lines.size(); i++) {
    std::string_view line = lines[i];
    if (trim(line).empty()) continue;

    size_t colon = line.find(':');
    if (colon == std::string_view::npos)
      return invalid(DecodeError::MalformedHeader);

    std::string name = to_lower(trim(line.substr(0, colon)));
    if (name.empty()) return invalid(DecodeError::MalformedHeader);

    // last occurrence wins
    req.headers[name] = std::string(trim(line.substr(colon + 1)));
  }

  auto te = req.headers.find("transfer-encoding");
  if (te != req.headers.end() && te->second == "chunked")
    return invalid(DecodeError::ChunkedNotSupported);

  std::optional<long long> declared;
  auto cl = req.headers.find("content-length");
  if (cl != req.headers.end() && !cl->second.empty()) {
    declared = parse_content_length(cl->second);
    if (!declared) return invalid(DecodeError::InvalidContentLength);
  }

  const size_t body_start = header_end + kHeaderTerminator.size();
  const size_t available = buffer.size() - body_start;

  // Without Content-Length a request carries no body; anything after the
  // header block belongs to the next pipelined request. A negative declared
  // length is accepted and framed as zero.
  size_t body_len = 0;
  if (declared && *declared > 0) {
    if (static_cast<unsigned long long>(*declared) > available)
      return DecodeIncomplete{};
    body_len = static_cast<size_t>(*declared);
  }

  // With no Content-Length the handler never sees these bytes; the session
  // decodes them as the next request.
  req.truncated = available > body_len;

  std::string_view raw = buffer.substr(body_start, body_len);
  auto ct = req.headers.find("content-type");
  if (ct != req.headers.end() && is_text_content_type(ct->second)) {
    req.body = std::string(raw);
  } else {
    req.body = Bytes(raw.begin(), raw.end());
  }

  DecodeComplete done;
  done.request = std::move(req);
  done.bytes_consumed = body_start + body_len;
  return done;
}
