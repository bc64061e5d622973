#pragma once

#include <string>
#include <utility>
#include <vector>

struct HttpResponse {
  int status = 0;
  std::string body;
};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

// Synchronous HTTP(S) POST with Boost.Beast. Throws TransportError on socket/TLS failure.
HttpResponse httpPost(const std::string& url, const HttpHeaders& headers, const std::string& body,
                      const std::string& contentType = "application/json");
