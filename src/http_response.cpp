#include "http_response.hpp"

#include <sstream>

static void upsert(HeaderList& headers, const std::string& name,
                   const std::string& value) {
  for (auto& h : headers) {
    if (h.first == name) {
      h.second = value;
      return;
    }
  }
  headers.emplace_back(name, value);
}

ResponseSpec ResponseSpec::text(int status, std::string body,
                                HeaderList headers) {
  ResponseSpec r;
  r.status = status;
  r.body = std::move(body);
  r.headers = std::move(headers);
  return r;
}

ResponseSpec ResponseSpec::bytes(int status, Bytes body, HeaderList headers) {
  ResponseSpec r;
  r.status = status;
  r.body = std::move(body);
  r.headers = std::move(headers);
  return r;
}

void ResponseSpec::set_header(const std::string& name,
                              const std::string& value) {
  upsert(headers, name, value);
}

const char* reason_phrase(int status) {
  switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 500: return "Internal Server Error";
    default: return "OK";
  }
}

std::string encode_response(const ResponseSpec& response) {
  return encode_response(response.status, response.body, response.headers);
}

std::string encode_response(int status, const Body& body,
                            const HeaderList& headers) {
  const char* data = nullptr;
  size_t len = 0;
  if (auto* s = std::get_if<std::string>(&body)) {
    data = s->data();
    len = s->size();
  } else {
    const auto& b = std::get<Bytes>(body);
    data = reinterpret_cast<const char*>(b.data());
    len = b.size();
  }

  HeaderList merged;
  merged.emplace_back("Content-Length", std::to_string(len));
  merged.emplace_back("Content-Type", "text/plain");
  for (const auto& h : headers) upsert(merged, h.first, h.second);

  std::ostringstream out;
  out << "HTTP/1.1 " << status << " " << reason_phrase(status) << "\r\n";
  for (const auto& h : merged) out << h.first << ": " << h.second << "\r\n";
  out << "\r\n";

  std::string wire = out.str();
  if (len > 0) wire.append(data, len);
  return wire;
}
