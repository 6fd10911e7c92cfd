#pragma once

#include <string>
#include <utility>
#include <vector>

#include "http_request.hpp"

// Ordered name/value pairs. Names are matched case-sensitively.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct ResponseSpec {
  int status = 200;
  Body body;
  HeaderList headers;  // override defaults on exact name match

  static ResponseSpec text(int status, std::string body, HeaderList headers = {});
  static ResponseSpec bytes(int status, Bytes body, HeaderList headers = {});

  // Replaces the value of an existing header with the same name or appends.
  void set_header(const std::string& name, const std::string& value);
};

// 200, 400, 404 and 500 are known; any other code reads "OK".
const char* reason_phrase(int status);

// Status line, Content-Length and Content-Type: text/plain defaults merged
// with the caller's headers, blank line, body.
std::string encode_response(const ResponseSpec& response);
std::string encode_response(int status, const Body& body,
                            const HeaderList& headers = {});
