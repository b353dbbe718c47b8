#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "kvproxy/handler.hpp"
#include "kvproxy/http.hpp"
#include "kvproxy/server.hpp"

static int fail(const std::string& msg, const char* file, int line) {
  std::cerr << "TEST FAIL: " << msg << " (" << file << ":" << line << ")\n";
  return 1;
}

#define EXPECT_TRUE(x)         \
  do {                         \
    if (!(x)) {                \
      return fail(#x, __FILE__, __LINE__); \
    }                          \
  } while (0)

#define EXPECT_EQ(a, b)                                              \
  do {                                                               \
    const auto _a = (a);                                             \
    const auto _b = (b);                                             \
    if (!(_a == _b)) {                                               \
      std::ostringstream ss;                                         \
      ss << #a << " == " << #b << " (got '" << _a << "' vs '" << _b << "')"; \
      return fail(ss.str(), __FILE__, __LINE__);                     \
    }                                                                \
  } while (0)

namespace {

using namespace kvproxy;

// Written by the fake backend as three separate, flushed writes.
const std::vector<std::string> kSseParts = {"event: x\n", "data: {\"a\":1}\n", "\n"};

std::string sse_bytes() {
  std::string all;
  for (const auto& part : kSseParts) {
    all += part;
  }
  return all;
}

// Minimal inference backend on 127.0.0.1. Serves one request per connection,
// one connection at a time, and remembers what it last received.
class FakeBackend {
 public:
  FakeBackend() : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    thread_ = std::thread([this]() { run(); });
  }

  ~FakeBackend() {
    stopping_.store(true);
    beast::error_code ec;
    tcp::socket wake(ioc_);
    wake.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port_), ec);
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

  std::string last_body() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_body_;
  }

  std::string last_target() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_target_;
  }

  std::string last_authorization() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_authorization_;
  }

  // True once a slow stream could no longer be written to the proxy.
  bool stream_cut() const { return stream_cut_.load(); }

 private:
  void run() {
    for (;;) {
      tcp::socket socket(ioc_);
      beast::error_code ec;
      acceptor_.accept(socket, ec);
      if (ec || stopping_.load()) {
        return;
      }
      serve(socket);
    }
  }

  void serve(tcp::socket& socket) {
    beast::error_code ec;
    socket.set_option(tcp::no_delay(true), ec);
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    http::read(socket, buffer, req, ec);
    if (ec) {
      return;
    }

    const std::string target(req.target().data(), req.target().size());
    {
      std::lock_guard<std::mutex> lock(mu_);
      last_target_ = target;
      last_body_ = req.body();
      const auto auth = req[http::field::authorization];
      last_authorization_.assign(auth.data(), auth.size());
    }

    if (target == "/v1/responses" && req.body().find("\"model\":\"cut-backend\"") != std::string::npos) {
      // Dies after the first chunk, without the terminating one.
      write_raw(socket, "HTTP/1.1 200 OK\r\nContent-Type: text/event-stream\r\nTransfer-Encoding: chunked\r\n\r\n");
      write_raw(socket, "9\r\n" + kSseParts[0] + "\r\n");
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      socket.close(ec);
      return;
    } else if (target == "/v1/responses" && req.body().find("\"model\":\"slow-stream\"") != std::string::npos) {
      write_raw(socket, "HTTP/1.1 200 OK\r\nContent-Type: text/event-stream\r\nConnection: close\r\n\r\n");
      for (int i = 0; i < 100; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        if (!write_raw(socket, kSseParts[0])) {
          stream_cut_.store(true);
          break;
        }
      }
    } else if (target == "/v1/responses" && req.body().find("\"stream\":true") != std::string::npos) {
      write_raw(socket, "HTTP/1.1 200 OK\r\nContent-Type: text/event-stream\r\nConnection: close\r\n\r\n");
      for (const auto& part : kSseParts) {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        write_raw(socket, part);
      }
    } else if (target == "/v1/responses") {
      write_response(socket, "200 OK", "application/json", "{\"id\":\"resp_1\",\"output\":[]}");
    } else if (target == "/v1/models") {
      write_response(socket, "200 OK", "application/json", "{\"data\":[{\"id\":\"local-model\"}]}");
    } else if (target == "/broken") {
      write_response(socket, "500 Internal Server Error", "text/plain", "Internal Server Error");
    } else if (target == "/file" && req.method() == http::verb::head) {
      write_raw(socket, "HTTP/1.1 200 OK\r\nContent-Type: application/octet-stream\r\nContent-Length: 1234\r\n"
                        "Connection: close\r\n\r\n");
    } else if (target == "/slow") {
      std::this_thread::sleep_for(std::chrono::milliseconds(2500));
      write_response(socket, "200 OK", "text/plain", "late");
    } else {
      write_response(socket, "201 Created", "text/plain", "echo:" + req.body());
    }
    socket.shutdown(tcp::socket::shutdown_send, ec);
  }

  static void write_response(tcp::socket& socket, const std::string& status, const std::string& content_type,
                             const std::string& body) {
    write_raw(socket, "HTTP/1.1 " + status + "\r\nContent-Type: " + content_type +
                          "\r\nContent-Length: " + std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" +
                          body);
  }

  static bool write_raw(tcp::socket& socket, const std::string& data) {
    beast::error_code ec;
    net::write(socket, net::buffer(data), ec);
    return !ec;
  }

  net::io_context ioc_;
  tcp::acceptor acceptor_;
  unsigned short port_{0};
  std::thread thread_;
  std::atomic<bool> stopping_{false};
  std::atomic<bool> stream_cut_{false};

  mutable std::mutex mu_;
  std::string last_body_;
  std::string last_target_;
  std::string last_authorization_;
};

// Records everything the handler sends to the client.
class RecordingChannel : public ClientChannel {
 public:
  bool send(unsigned status, const std::string& content_type, const std::string& body, const HeaderMap&) override {
    status_ = status;
    content_type_ = content_type;
    body_ = body;
    return true;
  }

  bool begin_stream(unsigned status, const std::string& content_type, const HeaderMap&) override {
    status_ = status;
    content_type_ = content_type;
    started_ = true;
    return true;
  }

  bool write_chunk(std::string_view bytes) override {
    chunks_.emplace_back(bytes);
    body_.append(bytes.data(), bytes.size());
    return true;
  }

  bool end_stream() override {
    ended_ = true;
    return true;
  }

  unsigned status_{0};
  std::string content_type_;
  std::string body_;
  std::vector<std::string> chunks_;
  bool started_{false};
  bool ended_{false};
};

unsigned short unused_port() {
  net::io_context ioc;
  tcp::acceptor probe(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
  return probe.local_endpoint().port();
}

Config proxy_config(const std::string& backend_url) {
  Config cfg;
  cfg.server.host = "127.0.0.1";
  cfg.server.port = 0;
  cfg.backend.url = backend_url;
  cfg.backend.timeout = 2;
  cfg.logging.file = "";
  return cfg;
}

// Sends a raw request and reads until the proxy closes the connection.
std::string raw_exchange(unsigned short port, const std::string& request) {
  net::io_context ioc;
  tcp::socket socket(ioc);
  beast::error_code ec;
  socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port), ec);
  if (ec) {
    return "";
  }
  net::write(socket, net::buffer(request), ec);
  std::string out;
  char buf[4096];
  for (;;) {
    const std::size_t n = socket.read_some(net::buffer(buf), ec);
    out.append(buf, n);
    if (ec) {
      break;
    }
  }
  return out;
}

std::string post_request(const std::string& version, const std::string& body) {
  return "POST /v1/responses " + version + "\r\nHost: 127.0.0.1\r\nContent-Type: application/json\r\n"
         "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

bool ends_with(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

const char* kTimestampedRequest =
    R"({"model":"local","input":[{"role":"system","content":"Be brief. [Wed 2026-02-18 20:48 UTC] ok"},)"
    R"({"role":"user","content":[{"type":"input_text","text":"[Wed 2026-02-18 20:48 UTC] hi"}]},)"
    R"({"type":"function_call_output","call_id":"c1","output":"[Wed 2026-02-18 20:48 UTC] raw"}],"stream":false})";

const char* kNormalizedRequest =
    R"({"model":"local","input":[{"role":"system","content":"Be brief. ok"},)"
    R"({"role":"user","content":[{"type":"input_text","text":"hi"}]},)"
    R"({"type":"function_call_output","call_id":"c1","output":"[Wed 2026-02-18 20:48 UTC] raw"}],"stream":false})";

}  // namespace

int main() {
  using namespace kvproxy;

  Logger::set_min_level(Logger::Level::kError);
  std::signal(SIGPIPE, SIG_IGN);

  FakeBackend backend;
  ProxyServer server(proxy_config(backend.url()));
  EXPECT_TRUE(server.start());
  EXPECT_TRUE(server.port() != 0);
  const std::string proxy = "http://127.0.0.1:" + std::to_string(server.port());
  const HeaderMap json_headers = {{"Content-Type", "application/json"}, {"Authorization", "Bearer local-key"}};

  HttpClient client;

  {
    const HttpResponse r = client.post(proxy + "/v1/responses", kTimestampedRequest, json_headers, 10);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.status, 200L);
    EXPECT_EQ(r.body, std::string("{\"id\":\"resp_1\",\"output\":[]}"));
    EXPECT_EQ(backend.last_target(), std::string("/v1/responses"));
    EXPECT_EQ(backend.last_body(), std::string(kNormalizedRequest));
    EXPECT_EQ(backend.last_authorization(), std::string("Bearer local-key"));
  }

  {
    // A body without volatile fields is forwarded byte for byte.
    const std::string body = "{\"model\":\"local\",\n  \"input\": \"plain\"}";
    const HttpResponse r = client.post(proxy + "/v1/responses", body, json_headers, 10);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(backend.last_body(), body);
  }

  {
    // Untouched input leaves the whole body as the client wrote it.
    const std::string body =
        "{ \"model\" : \"local\",\n  \"seed\":12345678901234567890123, \"temperature\":1E2,\n"
        "  \"input\" : [ {\"role\":\"user\", \"content\":[ {\"type\":\"input_text\",\"text\":\"hi\"} ]} ],"
        "\"stream\":false }";
    const HttpResponse r = client.post(proxy + "/v1/responses", body, json_headers, 10);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.status, 200L);
    EXPECT_EQ(backend.last_body(), body);

    // Normalized input only changes the affected string.
    std::string stamped = body;
    stamped.replace(stamped.find("\"hi\""), 4, "\"[Wed 2026-02-18 20:48 UTC] hi\"");
    const HttpResponse s = client.post(proxy + "/v1/responses", stamped, json_headers, 10);
    EXPECT_TRUE(s.ok());
    EXPECT_EQ(s.status, 200L);
    EXPECT_EQ(backend.last_body(), body);
  }

  {
    std::string body = kTimestampedRequest;
    body.replace(body.find("\"stream\":false"), 14, "\"stream\":true");
    std::string received;
    long head_status = 0;
    std::string head_type;
    const HttpResponse r = client.request_stream(
        "POST", proxy + "/v1/responses", body, json_headers,
        [&](long status, const std::map<std::string, std::string>& headers) {
          head_status = status;
          const auto it = headers.find("content-type");
          head_type = it == headers.end() ? "" : it->second;
          return true;
        },
        [&](std::string_view bytes) {
          received.append(bytes.data(), bytes.size());
          return true;
        },
        10);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(head_status, 200L);
    EXPECT_EQ(head_type, std::string("text/event-stream"));
    EXPECT_EQ(r.header("transfer-encoding"), std::string("chunked"));
    EXPECT_EQ(received, sse_bytes());
    EXPECT_TRUE(backend.last_body().find("[Wed 2026-02-18 20:48 UTC] hi") == std::string::npos);
  }

  {
    // HTTP/1.0 clients get the stream unframed, ended by connection close.
    std::string body = kTimestampedRequest;
    body.replace(body.find("\"stream\":false"), 14, "\"stream\":true");
    const std::string reply = raw_exchange(
        server.port(), "POST /v1/responses HTTP/1.0\r\nHost: 127.0.0.1\r\nContent-Type: application/json\r\n"
                       "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
    const auto split = reply.find("\r\n\r\n");
    EXPECT_TRUE(split != std::string::npos);
    EXPECT_TRUE(reply.compare(0, 12, "HTTP/1.0 200") == 0);
    EXPECT_TRUE(to_lower(reply.substr(0, split)).find("transfer-encoding") == std::string::npos);
    EXPECT_EQ(reply.substr(split + 4), sse_bytes());
  }

  {
    ProxyHandler handler(proxy_config(backend.url()));
    InboundRequest req;
    req.method = "POST";
    req.target = "/v1/responses";
    req.headers["content-type"] = "application/json";
    req.body = kTimestampedRequest;
    req.body.replace(req.body.find("\"stream\":false"), 14, "\"stream\":true");
    RecordingChannel channel;
    handler.handle(req, channel);
    EXPECT_TRUE(channel.started_);
    EXPECT_TRUE(channel.ended_);
    EXPECT_EQ(channel.status_, 200u);
    EXPECT_EQ(channel.body_, sse_bytes());
    EXPECT_TRUE(!channel.chunks_.empty());
  }

  {
    // Only a JSON true selects streaming.
    ProxyHandler handler(proxy_config(backend.url()));
    InboundRequest req;
    req.method = "POST";
    req.target = "/v1/responses";
    req.headers["content-type"] = "application/json";
    req.body = R"({"model":"local","input":[],"stream":1})";
    RecordingChannel channel;
    handler.handle(req, channel);
    EXPECT_TRUE(!channel.started_);
    EXPECT_EQ(channel.status_, 200u);
    EXPECT_EQ(channel.body_, std::string("{\"id\":\"resp_1\",\"output\":[]}"));
  }

  {
    // The backend dies mid-stream: what was relayed stands, the stream is not terminated.
    const uint64_t errors_before = metrics().get(kMetricUpstreamErrors);
    const std::string reply = raw_exchange(
        server.port(), post_request("HTTP/1.1", R"({"model":"cut-backend","input":[],"stream":true})"));
    const auto split = reply.find("\r\n\r\n");
    EXPECT_TRUE(split != std::string::npos);
    EXPECT_TRUE(reply.compare(0, 12, "HTTP/1.1 200") == 0);
    EXPECT_TRUE(to_lower(reply.substr(0, split)).find("transfer-encoding: chunked") != std::string::npos);
    EXPECT_TRUE(reply.find(kSseParts[0], split) != std::string::npos);
    EXPECT_TRUE(!ends_with(reply, "0\r\n\r\n"));
    EXPECT_EQ(metrics().get(kMetricUpstreamErrors), errors_before + 1);
  }

  {
    // The client hangs up mid-stream: the backend connection is dropped too.
    net::io_context ioc;
    tcp::socket socket(ioc);
    beast::error_code ec;
    socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), server.port()), ec);
    EXPECT_TRUE(!ec);
    net::write(socket, net::buffer(post_request("HTTP/1.1", R"({"model":"slow-stream","input":[],"stream":true})")),
               ec);
    EXPECT_TRUE(!ec);
    std::string seen;
    char buf[1024];
    while (seen.find(kSseParts[0]) == std::string::npos) {
      const std::size_t n = socket.read_some(net::buffer(buf), ec);
      if (ec) {
        break;
      }
      seen.append(buf, n);
    }
    EXPECT_TRUE(seen.find(kSseParts[0]) != std::string::npos);
    socket.close(ec);

    for (int i = 0; i < 60 && !backend.stream_cut(); ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    EXPECT_TRUE(backend.stream_cut());
  }

  {
    // HEAD keeps the backend's Content-Length and carries no body.
    const std::string reply =
        raw_exchange(server.port(), "HEAD /file HTTP/1.1\r\nHost: 127.0.0.1\r\nConnection: close\r\n\r\n");
    EXPECT_TRUE(reply.compare(0, 12, "HTTP/1.1 200") == 0);
    EXPECT_TRUE(to_lower(reply).find("content-length: 1234\r\n") != std::string::npos);
    EXPECT_TRUE(ends_with(reply, "\r\n\r\n"));
  }

  {
    Config cfg = proxy_config(backend.url());
    cfg.server.max_connections = 1;
    ProxyServer small(cfg);
    EXPECT_TRUE(small.start());
    const std::string health = "GET /health HTTP/1.1\r\nHost: 127.0.0.1\r\nConnection: close\r\n\r\n";

    net::io_context ioc;
    tcp::socket held(ioc);
    beast::error_code ec;
    held.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), small.port()), ec);
    EXPECT_TRUE(!ec);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    // Turned away on accept, before any request is read.
    const std::string busy = raw_exchange(small.port(), "");
    EXPECT_TRUE(busy.compare(0, 12, "HTTP/1.1 503") == 0);
    EXPECT_TRUE(to_lower(busy).find("retry-after: 1\r\n") != std::string::npos);
    EXPECT_TRUE(busy.find("overloaded") != std::string::npos);

    // The slot frees up once the idle connection goes away.
    held.close(ec);
    std::string reply;
    for (int i = 0; i < 40; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      reply = raw_exchange(small.port(), health);
      if (reply.compare(0, 12, "HTTP/1.1 200") == 0) {
        break;
      }
    }
    EXPECT_TRUE(reply.compare(0, 12, "HTTP/1.1 200") == 0);
    small.stop();
  }

  {
    const HttpResponse r = client.get(proxy + "/v1/models", {}, 10);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.status, 200L);
    EXPECT_EQ(json::parse(r.body)["data"][0]["id"].get<std::string>(), std::string("local-model"));
  }

  {
    // Non-JSON error bodies and their status pass through unchanged.
    const HttpResponse r = client.get(proxy + "/broken", {}, 10);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.status, 500L);
    EXPECT_EQ(r.body, std::string("Internal Server Error"));
  }

  {
    const HttpResponse r = client.post(proxy + "/v1/chat/completions", "not json at all", json_headers, 10);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.status, 201L);
    EXPECT_EQ(r.body, std::string("echo:not json at all"));
    EXPECT_EQ(backend.last_target(), std::string("/v1/chat/completions"));
  }

  {
    const HttpResponse r = client.get(proxy + "/health", {}, 10);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.status, 200L);
    const json health = json::parse(r.body);
    EXPECT_EQ(health["status"].get<std::string>(), std::string("ok"));
    EXPECT_EQ(health["backend"].get<std::string>(), backend.url());
    EXPECT_TRUE(health["metrics"]["streams"].get<uint64_t>() >= 2u);
  }

  {
    ProxyServer orphan(proxy_config("http://127.0.0.1:" + std::to_string(unused_port())));
    EXPECT_TRUE(orphan.start());
    const std::string orphan_url = "http://127.0.0.1:" + std::to_string(orphan.port());

    const HttpResponse r = client.post(orphan_url + "/v1/responses", kTimestampedRequest, json_headers, 10);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.status, 502L);
    EXPECT_EQ(json::parse(r.body)["error"]["type"].get<std::string>(), std::string("upstream_error"));

    std::string body = kTimestampedRequest;
    body.replace(body.find("\"stream\":false"), 14, "\"stream\":true");
    const HttpResponse s = client.post(orphan_url + "/v1/responses", body, json_headers, 10);
    EXPECT_TRUE(s.ok());
    EXPECT_EQ(s.status, 502L);
    orphan.stop();
  }

  {
    // Runs last: the fake backend stays busy until the slow reply is written.
    const HttpResponse r = client.get(proxy + "/slow", {}, 10);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.status, 504L);
  }

  server.stop();
  EXPECT_TRUE(!server.running());

  std::cout << "OK\n";
  return 0;
}
