#pragma once
#include <string>
#include <unordered_map>

struct HttpResponse {
  long status = 0;
  std::string body;
  std::string error; // transport error, empty when a response was received
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse Post(const std::string& url,
                            const std::string& body,
                            const std::unordered_map<std::string, std::string>& headers,
                            int timeout_ms) = 0;
};

// Persistent-connection knobs for the libcurl client
struct HttpClientTuning {
  bool enable_http2 = true;
  bool enable_tcp_keepalive = true;
  int tcp_keepidle_s = 30;
  int tcp_keepintvl_s = 15;
  bool verify_tls = true;
};

// libcurl-backed client; caller owns the returned object.
HttpClient* CreateCurlHttpClient(const HttpClientTuning& tuning = HttpClientTuning());
