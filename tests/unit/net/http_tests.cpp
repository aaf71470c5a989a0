#include <cstdlib>
#include <iostream>
#include <string>

#include "crypto/hash.hpp"
#include "net/http.hpp"
#include "util/base64.hpp"

namespace {

bool Check(bool condition, const std::string& what) {
  if (!condition) {
    std::cerr << "http_tests: " << what << "\n";
  }
  return condition;
}

bool TestHeaderLookup() {
  const std::string headers =
      "Host: 127.0.0.1:5555\r\ncontent-type:  application/json \r\nContent-Length: 42\r\n"
      "X-Empty:";
  bool ok = true;
  const auto type = listenoracle::net::FindHeaderValue(headers, "Content-Type");
  ok &= Check(type && *type == "application/json", "case-insensitive lookup trims value");
  const auto empty = listenoracle::net::FindHeaderValue(headers, "x-empty");
  ok &= Check(empty && empty->empty(), "header without value");
  ok &= Check(!listenoracle::net::FindHeaderValue(headers, "Authorization"), "absent header");
  ok &= Check(listenoracle::net::ParseContentLength(headers) == 42, "content length");
  ok &= Check(listenoracle::net::ParseContentLength("Content-Length: 4x") == -1,
              "non-numeric content length");
  ok &= Check(listenoracle::net::ParseContentLength("Host: a") == -1, "missing content length");
  return ok;
}

bool TestUrlEncode() {
  bool ok = true;
  ok &= Check(listenoracle::net::UrlEncode("short_term") == "short_term", "unreserved passthrough");
  ok &= Check(listenoracle::net::UrlEncode("a b&c=d") == "a%20b%26c%3Dd", "reserved escaped");
  ok &= Check(listenoracle::net::UrlEncode("\xC3\xA9") == "%C3%A9", "utf-8 bytes escaped");
  return ok;
}

bool TestRefusesLineBreaks() {
  listenoracle::net::HttpClient::Options options;
  options.host = "127.0.0.1";
  options.port = 1;
  options.timeout_ms = 200;
  const listenoracle::net::HttpClient client(options);

  auto refused = [&client](const listenoracle::net::HttpRequest& request, const char* expected) {
    listenoracle::net::HttpResponse response;
    std::string error;
    return !client.Send(request, &response, &error) && error == expected;
  };
  bool ok = true;
  listenoracle::net::HttpRequest request;
  request.headers.emplace_back("Authorization", "Bearer tok\r\nX-Injected: evil");
  ok &= Check(refused(request, "invalid characters in request header"), "CRLF in header value");
  request.headers.assign({{"X-Bad\nName", "v"}});
  ok &= Check(refused(request, "invalid characters in request header"), "LF in header name");
  request.headers.assign({{"", "v"}});
  ok &= Check(refused(request, "invalid characters in request header"), "empty header name");
  request.headers.clear();
  request.target = "/me HTTP/1.1\r\nHost: other";
  ok &= Check(refused(request, "invalid characters in request line"), "CRLF in target");
  return ok;
}

bool TestBase64() {
  bool ok = true;
  ok &= Check(listenoracle::util::Base64Encode("admin:secret") == "YWRtaW46c2VjcmV0",
              "encode credentials");
  ok &= Check(listenoracle::util::Base64Encode("a") == "YQ==", "encode with padding");
  const auto decoded = listenoracle::util::Base64Decode("YWRtaW46c2VjcmV0");
  ok &= Check(decoded && *decoded == "admin:secret", "decode credentials");
  ok &= Check(!listenoracle::util::Base64Decode("YQ==YQ"), "data after padding rejected");
  ok &= Check(!listenoracle::util::Base64Decode("Y$=="), "invalid character rejected");
  return ok;
}

bool TestDigests() {
  bool ok = true;
  ok &= Check(listenoracle::crypto::Sha3_256Hex("") ==
                  "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a",
              "sha3-256 of empty string");
  ok &= Check(listenoracle::crypto::Sha3_256Hex("abc") ==
                  "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532",
              "sha3-256 of abc");
  const auto a = listenoracle::crypto::Sha3_256("secret");
  const auto b = listenoracle::crypto::Sha3_256("secret");
  const auto c = listenoracle::crypto::Sha3_256("Secret");
  ok &= Check(listenoracle::crypto::DigestsEqual(a, b), "equal digests");
  ok &= Check(!listenoracle::crypto::DigestsEqual(a, c), "different digests");
  return ok;
}

}  // namespace

int main() {
  bool ok = TestHeaderLookup();
  ok &= TestUrlEncode();
  ok &= TestRefusesLineBreaks();
  ok &= TestBase64();
  ok &= TestDigests();
  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
