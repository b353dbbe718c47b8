#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

#include <curl/curl.h>

#include "kvproxy/common.hpp"

namespace kvproxy {

struct HttpResponse {
  long status{0};
  std::string body;
  std::string error;
  std::map<std::string, std::string> headers{};
  CURLcode code{CURLE_OK};

  bool ok() const { return code == CURLE_OK; }
  bool timed_out() const { return code == CURLE_OPERATION_TIMEDOUT; }

  std::string header(const std::string& lower_name) const {
    const auto it = headers.find(lower_name);
    return it == headers.end() ? std::string() : it->second;
  }
};

// Called once, before the first body byte, with the backend's status and headers.
using HeadHandler = std::function<bool(long status, const std::map<std::string, std::string>& headers)>;
// Called for every block of body bytes exactly as libcurl received it.
// Return false to abort the transfer.
using ChunkHandler = std::function<bool(std::string_view bytes)>;

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

  HttpResponse get(const std::string& url, const std::map<std::string, std::string>& headers = {},
                   int timeout_s = 30) {
    return request("GET", url, "", headers, timeout_s);
  }

  HttpResponse post(const std::string& url, const std::string& body,
                    const std::map<std::string, std::string>& headers = {}, int timeout_s = 60) {
    return request("POST", url, body, headers, timeout_s);
  }

  HttpResponse request(const std::string& method, const std::string& url, const std::string& body,
                       const std::map<std::string, std::string>& headers, int timeout_s) {
    CURL* curl = ensure_easy();
    if (!curl) {
      return init_failure();
    }

    curl_easy_reset(curl);
    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &header_cb);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response_headers);
    apply_common_options(curl, timeout_s);
    apply_method(curl, method, body);
    curl_slist* header_list = build_header_list(headers);
    if (header_list) {
      curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    const CURLcode rc = curl_easy_perform(curl);

    HttpResponse out = collect(curl, rc);
    out.body = std::move(response_body);
    out.headers = std::move(response_headers);

    if (header_list) {
      curl_slist_free_all(header_list);
    }
    return out;
  }

  // Streams the response body through `on_chunk` without any re-framing: the
  // handler sees the bytes in the order and grouping libcurl delivered them.
  HttpResponse request_stream(const std::string& method, const std::string& url, const std::string& body,
                              const std::map<std::string, std::string>& headers, const HeadHandler& on_head,
                              const ChunkHandler& on_chunk, int timeout_s) {
    CURL* curl = ensure_easy();
    if (!curl) {
      return init_failure();
    }

    curl_easy_reset(curl);
    StreamState state;
    state.curl = curl;
    state.on_head = on_head;
    state.on_chunk = on_chunk;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &stream_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &header_cb);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &state.headers);
    apply_common_options(curl, timeout_s);
    apply_method(curl, method, body);
    curl_slist* header_list = build_header_list(headers);
    if (header_list) {
      curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    const CURLcode rc = curl_easy_perform(curl);

    HttpResponse out = collect(curl, rc);
    out.headers = std::move(state.headers);
    if (!state.head_sent && rc == CURLE_OK && on_head) {
      // Empty body: the head still has to reach the caller. The transfer is
      // over, so there is nothing left for the handler to stop.
      on_head(out.status, out.headers);
    }

    if (header_list) {
      curl_slist_free_all(header_list);
    }
    return out;
  }

 private:
  struct StreamState {
    CURL* curl{nullptr};
    std::map<std::string, std::string> headers;
    HeadHandler on_head;
    ChunkHandler on_chunk;
    bool head_sent{false};
    bool aborted{false};
  };

  static HttpResponse init_failure() {
    HttpResponse out;
    out.code = CURLE_FAILED_INIT;
    out.error = "curl init failed";
    return out;
  }

  static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const auto n = size * nmemb;
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, n);
    return n;
  }

  static size_t header_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const auto n = size * nmemb;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers || !ptr || n == 0) {
      return n;
    }

    std::string line(ptr, n);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
      line.pop_back();
    }

    const auto p = line.find(':');
    if (p == std::string::npos) {
      return n;
    }

    std::string key = trim(line.substr(0, p));
    std::string val = trim(line.substr(p + 1));
    if (key.empty()) {
      return n;
    }
    (*headers)[to_lower(key)] = val;
    return n;
  }

  static size_t stream_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const auto n = size * nmemb;
    auto* st = static_cast<StreamState*>(userdata);
    if (!st || st->aborted) {
      return 0;
    }

    if (!st->head_sent) {
      st->head_sent = true;
      long status = 0;
      curl_easy_getinfo(st->curl, CURLINFO_RESPONSE_CODE, &status);
      if (st->on_head && !st->on_head(status, st->headers)) {
        st->aborted = true;
        return 0;
      }
    }

    if (st->on_chunk && !st->on_chunk(std::string_view(ptr, n))) {
      st->aborted = true;
      return 0;  // abort transfer
    }
    return n;
  }

  static void ensure_global_init() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  }

  CURL* easy_{nullptr};

  CURL* ensure_easy() {
    if (!easy_) {
      easy_ = curl_easy_init();
    }
    return easy_;
  }

  static curl_slist* build_header_list(const std::map<std::string, std::string>& headers) {
    curl_slist* list = nullptr;
    for (const auto& [k, v] : headers) {
      const std::string line = k + ": " + v;
      list = curl_slist_append(list, line.c_str());
    }
    // Large prompt bodies would otherwise wait on "Expect: 100-continue".
    list = curl_slist_append(list, "Expect:");
    return list;
  }

  static void apply_method(CURL* curl, const std::string& method, const std::string& body) {
    if (method == "GET" && body.empty()) {
      curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (method == "HEAD") {
      curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else if (method == "POST") {
      curl_easy_setopt(curl, CURLOPT_POST, 1L);
    } else {
      curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    if (method != "HEAD" && (!body.empty() || method == "POST")) {
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    }
  }

  static void apply_common_options(CURL* curl, int timeout_s) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_s));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>((std::min)(10, (std::max)(1, timeout_s / 3))));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "kvproxy/0.1");
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
  }

  static HttpResponse collect(CURL* curl, CURLcode rc) {
    HttpResponse out;
    out.code = rc;
    if (rc != CURLE_OK) {
      out.error = curl_easy_strerror(rc);
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);
    return out;
  }
};

}  // namespace kvproxy
