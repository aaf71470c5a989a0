#include "net/http.hpp"

#include <array>
#include <cctype>
#include <sstream>
#include <stdexcept>

#include "net/socket.hpp"
#include "util/hex.hpp"

namespace listenoracle::net {

namespace {

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

std::string_view TrimView(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

void SetError(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
}

bool HasLineBreak(std::string_view text) {
  return text.find_first_of("\r\n") != std::string_view::npos;
}

int ParseStatusLine(std::string_view line) {
  // HTTP/1.1 200 OK
  if (!line.starts_with("HTTP/")) {
    return -1;
  }
  const auto space = line.find(' ');
  if (space == std::string_view::npos || space + 4 > line.size()) {
    return -1;
  }
  int status = 0;
  for (std::size_t i = space + 1; i < space + 4; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(line[i]))) {
      return -1;
    }
    status = status * 10 + (line[i] - '0');
  }
  return status;
}

bool DecodeChunked(std::string_view raw, std::string* out, std::size_t max_body) {
  out->clear();
  std::size_t pos = 0;
  while (true) {
    const auto eol = raw.find("\r\n", pos);
    if (eol == std::string_view::npos) {
      return false;
    }
    auto size_field = raw.substr(pos, eol - pos);
    const auto ext = size_field.find(';');
    if (ext != std::string_view::npos) {
      size_field = size_field.substr(0, ext);
    }
    size_field = TrimView(size_field);
    if (size_field.empty() || size_field.size() > 15) {
      return false;
    }
    std::size_t chunk_size = 0;
    for (char c : size_field) {
      const int digit = util::HexDigitValue(c);
      if (digit < 0) {
        return false;
      }
      chunk_size = (chunk_size << 4) | static_cast<std::size_t>(digit);
    }
    pos = eol + 2;
    if (chunk_size == 0) {
      return true;
    }
    if (pos + chunk_size + 2 > raw.size() || out->size() + chunk_size > max_body) {
      return false;
    }
    out->append(raw.substr(pos, chunk_size));
    pos += chunk_size;
    if (raw.substr(pos, 2) != "\r\n") {
      return false;
    }
    pos += 2;
  }
}

}  // namespace

std::optional<std::string_view> FindHeaderValue(std::string_view headers, std::string_view name) {
  std::size_t start = 0;
  while (start < headers.size()) {
    auto end = headers.find("\r\n", start);
    auto line = end == std::string_view::npos ? headers.substr(start)
                                              : headers.substr(start, end - start);
    const auto colon = line.find(':');
    if (colon != std::string_view::npos && EqualsIgnoreCase(TrimView(line.substr(0, colon)), name)) {
      return TrimView(line.substr(colon + 1));
    }
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 2;
  }
  return std::nullopt;
}

long long ParseContentLength(std::string_view headers) {
  const auto value = FindHeaderValue(headers, "Content-Length");
  if (!value || value->empty() || value->size() > 18) {
    return -1;
  }
  long long length = 0;
  for (char c : *value) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return -1;
    }
    length = length * 10 + (c - '0');
  }
  return length;
}

std::string UrlEncode(std::string_view value) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

HttpClient::HttpClient(Options options) : options_(std::move(options)) {}

bool HttpClient::Send(const HttpRequest& request, HttpResponse* response,
                      std::string* error) const {
  if (!response) {
    SetError(error, "invalid response buffer");
    return false;
  }
  if (HasLineBreak(request.method) || HasLineBreak(request.target)) {
    SetError(error, "invalid characters in request line");
    return false;
  }
  for (const auto& [name, value] : request.headers) {
    if (name.empty() || HasLineBreak(name) || HasLineBreak(value)) {
      SetError(error, "invalid characters in request header");
      return false;
    }
  }
  TcpSocket socket;
  if (!socket.Connect(options_.host, options_.port, options_.timeout_ms, /*quiet=*/true)) {
    SetError(error, "failed to connect to " + options_.host + ":" + std::to_string(options_.port));
    return false;
  }
  if (options_.timeout_ms > 0) {
    (void)socket.SetTimeout(options_.timeout_ms);
  }

  std::ostringstream oss;
  oss << request.method << " " << request.target << " HTTP/1.1\r\n";
  oss << "Host: " << options_.host;
  if (options_.port != 80) {
    oss << ":" << options_.port;
  }
  oss << "\r\n";
  for (const auto& [name, value] : request.headers) {
    oss << name << ": " << value << "\r\n";
  }
  if (!request.body.empty() || request.method == "POST") {
    oss << "Content-Length: " << request.body.size() << "\r\n";
  }
  oss << "Connection: close\r\n\r\n";
  oss << request.body;
  if (!socket.SendAll(oss.str())) {
    SetError(error, "failed to send request");
    return false;
  }

  std::string raw;
  raw.reserve(4096);
  std::array<std::uint8_t, 4096> chunk{};
  std::size_t header_end = std::string::npos;
  long long content_length = -1;
  bool chunked = false;
  while (true) {
    const auto bytes = socket.Recv(chunk.data(), chunk.size());
    if (bytes < 0) {
      SetError(error, "receive failed or timed out");
      return false;
    }
    if (bytes == 0) {
      break;
    }
    raw.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(bytes));
    if (header_end == std::string::npos) {
      header_end = raw.find("\r\n\r\n");
      if (header_end == std::string::npos) {
        if (raw.size() > options_.max_header_bytes) {
          SetError(error, "response headers too large");
          return false;
        }
        continue;
      }
      const std::string_view headers(raw.data(), header_end);
      content_length = ParseContentLength(headers);
      const auto encoding = FindHeaderValue(headers, "Transfer-Encoding");
      chunked = encoding && encoding->find("chunked") != std::string_view::npos;
    }
    const std::size_t body_bytes = raw.size() - (header_end + 4);
    // Chunk framing adds size lines on top of the payload itself.
    if (body_bytes > options_.max_body_bytes + options_.max_header_bytes) {
      SetError(error, "response body too large");
      return false;
    }
    if (!chunked && content_length >= 0 &&
        body_bytes >= static_cast<std::size_t>(content_length)) {
      break;
    }
    if (chunked && raw.ends_with("\r\n\r\n")) {
      std::string decoded;
      if (DecodeChunked(std::string_view(raw).substr(header_end + 4), &decoded,
                        options_.max_body_bytes)) {
        break;
      }
    }
  }
  if (header_end == std::string::npos) {
    SetError(error, "malformed HTTP response");
    return false;
  }

  const std::string_view head(raw.data(), header_end);
  const auto status_end = head.find("\r\n");
  response->status = ParseStatusLine(head.substr(0, status_end));
  if (response->status < 0) {
    SetError(error, "malformed HTTP status line");
    return false;
  }
  response->headers =
      status_end == std::string_view::npos ? std::string() : std::string(head.substr(status_end + 2));
  const std::string_view payload(raw.data() + header_end + 4, raw.size() - header_end - 4);
  if (chunked) {
    if (!DecodeChunked(payload, &response->body, options_.max_body_bytes)) {
      SetError(error, "malformed chunked response body");
      return false;
    }
  } else if (content_length >= 0) {
    if (payload.size() < static_cast<std::size_t>(content_length)) {
      SetError(error, "truncated HTTP response body");
      return false;
    }
    response->body.assign(payload.substr(0, static_cast<std::size_t>(content_length)));
  } else {
    response->body.assign(payload);
  }
  return true;
}

}  // namespace listenoracle::net
