#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace listenoracle::net {

// Value of the first header named `name` (case-insensitive) in a CRLF
// separated header block, with surrounding whitespace removed.
std::optional<std::string_view> FindHeaderValue(std::string_view headers, std::string_view name);

// -1 when the header is absent or malformed.
long long ParseContentLength(std::string_view headers);

// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string UrlEncode(std::string_view value);

struct HttpRequest {
  std::string method{"GET"};
  std::string target{"/"};
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
};

struct HttpResponse {
  int status{0};
  std::string headers;
  std::string body;
};

// One request per connection (Connection: close). Bodies framed by
// Content-Length, chunked transfer coding, or connection close are
// accepted.
class HttpClient {
 public:
  struct Options {
    std::string host{"127.0.0.1"};
    std::uint16_t port{80};
    int timeout_ms{10000};
    std::size_t max_header_bytes{16 * 1024};
    std::size_t max_body_bytes{4 * 1024 * 1024};
  };

  explicit HttpClient(Options options);

  // Requests whose method, target or headers contain CR or LF are refused
  // before any connection is made.
  bool Send(const HttpRequest& request, HttpResponse* response, std::string* error) const;

  const Options& options() const noexcept { return options_; }

 private:
  Options options_;
};

}  // namespace listenoracle::net
