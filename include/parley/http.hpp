#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <curl/curl.h>

#include "parley/common.hpp"

namespace parley {

struct HttpResponse {
  long status{0};
  std::string body;
  std::string error;
  std::map<std::string, std::string> headers{};

  bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

// One part of a multipart/form-data body. Parts with a filename are sent as
// file uploads.
struct MultipartPart {
  std::string name;
  std::string data;
  std::string filename;
  std::string content_type;
};

// Thin wrapper over a curl easy handle. Not thread safe; keep one per thread.
class HttpClient {
 public:
  HttpClient() {
    ensure_global_init();
    easy_ = curl_easy_init();
  }

  ~HttpClient() {
    if (easy_) {
      curl_easy_cleanup(easy_);
      easy_ = nullptr;
    }
  }

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  // `method` is one of GET, POST, PUT, PATCH, DELETE. The body is sent for
  // every method except GET when non-empty.
  HttpResponse request(const std::string& method, const std::string& url, const std::string& body,
                       const std::map<std::string, std::string>& headers, int timeout_s = 30) {
    CURL* curl = ensure_easy();
    if (!curl) {
      return HttpResponse{0, "", "curl init failed"};
    }

    curl_easy_reset(curl);
    HttpResponse out;
    apply_common_options(curl, url, out, timeout_s);

    if (method == "POST") {
      curl_easy_setopt(curl, CURLOPT_POST, 1L);
    } else if (method != "GET") {
      curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    if (method != "GET" && (method == "POST" || !body.empty())) {
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    struct curl_slist* header_list = build_headers(headers);
    if (header_list) {
      curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    perform(curl, out);
    if (header_list) {
      curl_slist_free_all(header_list);
    }
    return out;
  }

  HttpResponse request_multipart(const std::string& method, const std::string& url,
                                 const std::map<std::string, std::string>& headers,
                                 const std::vector<MultipartPart>& parts, int timeout_s = 120) {
    CURL* curl = ensure_easy();
    if (!curl) {
      return HttpResponse{0, "", "curl init failed"};
    }

    curl_easy_reset(curl);
    HttpResponse out;
    apply_common_options(curl, url, out, timeout_s);

    curl_mime* mime = curl_mime_init(curl);
    if (!mime) {
      return HttpResponse{0, "", "curl mime init failed"};
    }
    for (const auto& p : parts) {
      curl_mimepart* part = curl_mime_addpart(mime);
      curl_mime_name(part, p.name.c_str());
      curl_mime_data(part, p.data.data(), p.data.size());
      if (!p.filename.empty()) {
        curl_mime_filename(part, p.filename.c_str());
      }
      if (!p.content_type.empty()) {
        curl_mime_type(part, p.content_type.c_str());
      }
    }
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    if (method != "POST") {
      curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    struct curl_slist* header_list = build_headers(headers);
    if (header_list) {
      curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    perform(curl, out);
    if (header_list) {
      curl_slist_free_all(header_list);
    }
    curl_mime_free(mime);
    return out;
  }

 private:
  static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const auto n = size * nmemb;
    static_cast<std::string*>(userdata)->append(ptr, n);
    return n;
  }

  static size_t header_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const auto n = size * nmemb;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers || !ptr || n == 0) {
      return n;
    }

    std::string line(ptr, n);
    const auto p = line.find(':');
    if (p == std::string::npos) {
      return n;
    }
    const std::string key = to_lower(trim(line.substr(0, p)));
    if (!key.empty()) {
      (*headers)[key] = trim(line.substr(p + 1));
    }
    return n;
  }

  static struct curl_slist* build_headers(const std::map<std::string, std::string>& headers) {
    struct curl_slist* list = nullptr;
    for (const auto& [k, v] : headers) {
      const std::string line = k + ": " + v;
      list = curl_slist_append(list, line.c_str());
    }
    return list;
  }

  static void ensure_global_init() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  }

  CURL* ensure_easy() {
    if (!easy_) {
      easy_ = curl_easy_init();
    }
    return easy_;
  }

  void apply_common_options(CURL* curl, const std::string& url, HttpResponse& out, int timeout_s) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &header_cb);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &out.headers);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_s));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>((std::min)(10, (std::max)(1, timeout_s / 3))));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "DiscordBot (parley, 0.1)");
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  }

  static void perform(CURL* curl, HttpResponse& out) {
    const CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
      out.error = curl_easy_strerror(rc);
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);
  }

  CURL* easy_{nullptr};
};

}  // namespace parley
