#include "net/http_client.hpp"
#include "common/logger.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace {
size_t AppendBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
  static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
  return size * nmemb;
}

struct SlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

struct EasyDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};
using EasyPtr = std::unique_ptr<CURL, EasyDeleter>;
}

// One easy handle reused across requests so the node connection stays warm.
class CurlHttpClient : public HttpClient {
public:
  explicit CurlHttpClient(const HttpClientTuning& tuning) : tuning_(tuning) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    handle_.reset(curl_easy_init());
  }
  ~CurlHttpClient() override {
    handle_.reset();
    curl_global_cleanup();
  }

  HttpResponse Post(const std::string& url,
                    const std::string& body,
                    const std::unordered_map<std::string, std::string>& headers,
                    int timeout_ms) override {
    HttpResponse resp;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle_) {
      resp.error = "curl_easy_init failed";
      Logger::Error(resp.error);
      return resp;
    }
    CURL* curl = handle_.get();
    curl_easy_reset(curl);

    SlistPtr header_list;
    for (const auto& kv : headers) {
      const std::string line = kv.first + ": " + kv.second;
      curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
      if (!appended) {
        resp.error = "curl_slist_append failed";
        return resp;
      }
      header_list.release();
      header_list.reset(appended);
    }

    std::string received;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, AppendBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &received);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, tuning_.enable_tcp_keepalive ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, static_cast<long>(tuning_.tcp_keepidle_s));
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, static_cast<long>(tuning_.tcp_keepintvl_s));
    if (tuning_.enable_http2) curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    if (!tuning_.verify_tls) {
      curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
      curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    const CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
      resp.error = std::string("POST ") + url + " failed: " + curl_easy_strerror(rc);
      Logger::Warning(resp.error);
      return resp;
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(received);
    return resp;
  }

private:
  HttpClientTuning tuning_;
  std::mutex mutex_;
  EasyPtr handle_;
};

HttpClient* CreateCurlHttpClient(const HttpClientTuning& tuning) {
  return new CurlHttpClient(tuning);
}
