#pragma once

#include <sys/socket.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_set>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "kvproxy/capture_log.hpp"
#include "kvproxy/channel.hpp"
#include "kvproxy/config.hpp"
#include "kvproxy/handler.hpp"

namespace kvproxy {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

inline constexpr std::uint64_t kMaxRequestBodyBytes = 64ull * 1024 * 1024;

// ClientChannel over a blocking socket. HTTP/1.1 streams use chunked
// transfer encoding, one HTTP chunk per relayed block; HTTP/1.0 streams are
// written raw and delimited by closing the connection.
class SocketChannel : public ClientChannel {
 public:
  SocketChannel(tcp::socket& socket, unsigned version, bool keep_alive, bool head_only = false)
      : socket_(socket), version_(version), keep_alive_(keep_alive), head_only_(head_only) {}

  bool send(unsigned status, const std::string& content_type, const std::string& body,
            const HeaderMap& extra_headers) override {
    if (failed_) {
      return false;
    }
    http::response<http::string_body> res;
    res.version(version_);
    res.result(status);
    res.set(http::field::server, "kvproxy");
    res.set(http::field::content_type, content_type);
    for (const auto& [k, v] : extra_headers) {
      res.set(k, v);
    }
    res.keep_alive(keep_alive_);

    beast::error_code ec;
    if (head_only_) {
      // A HEAD reply describes the body without carrying it.
      http::response<http::empty_body> head(std::move(res.base()));
      if (head.find(http::field::content_length) == head.end()) {
        head.content_length(body.size());
      }
      http::write(socket_, head, ec);
    } else {
      res.body() = body;
      res.prepare_payload();
      http::write(socket_, res, ec);
    }
    responded_ = true;
    return check(ec);
  }

  bool begin_stream(unsigned status, const std::string& content_type, const HeaderMap& extra_headers) override {
    if (failed_) {
      return false;
    }
    http::response<http::empty_body> res;
    res.version(version_);
    res.result(status);
    res.set(http::field::server, "kvproxy");
    res.set(http::field::content_type, content_type);
    for (const auto& [k, v] : extra_headers) {
      res.set(k, v);
    }
    if (version_ >= 11) {
      res.keep_alive(keep_alive_);
      res.chunked(true);
    } else {
      keep_alive_ = false;
      res.keep_alive(false);
    }

    http::response_serializer<http::empty_body> sr{res};
    beast::error_code ec;
    http::write_header(socket_, sr, ec);
    responded_ = true;
    streaming_ = true;
    return check(ec);
  }

  bool write_chunk(std::string_view bytes) override {
    if (failed_) {
      return false;
    }
    if (bytes.empty()) {
      return true;
    }
    beast::error_code ec;
    const net::const_buffer data(bytes.data(), bytes.size());
    if (version_ >= 11) {
      net::write(socket_, http::make_chunk(data), ec);
    } else {
      net::write(socket_, data, ec);
    }
    return check(ec);
  }

  bool end_stream() override {
    if (failed_) {
      return false;
    }
    if (version_ >= 11) {
      beast::error_code ec;
      net::write(socket_, http::make_chunk_last(), ec);
      if (!check(ec)) {
        return false;
      }
    }
    stream_ended_ = true;
    return true;
  }

  bool responded() const { return responded_; }

  // Whether another request may follow on this connection.
  bool reusable() const {
    return responded_ && !failed_ && keep_alive_ && (!streaming_ || stream_ended_);
  }

 private:
  bool check(const beast::error_code& ec) {
    if (ec) {
      failed_ = true;
      Logger::log(Logger::Level::kDebug, "client write failed: " + ec.message());
      return false;
    }
    return true;
  }

  tcp::socket& socket_;
  unsigned version_{11};
  bool keep_alive_{true};
  bool head_only_{false};
  bool responded_{false};
  bool streaming_{false};
  bool stream_ended_{false};
  bool failed_{false};
};

inline InboundRequest to_inbound(http::request<http::string_body>&& req) {
  InboundRequest in;
  const auto method = req.method_string();
  in.method.assign(method.data(), method.size());
  const auto target = req.target();
  in.target.assign(target.data(), target.size());
  for (const auto& field : req) {
    const auto name = field.name_string();
    const auto value = field.value();
    in.headers[to_lower(std::string(name.data(), name.size()))] = std::string(value.data(), value.size());
  }
  in.body = std::move(req.body());
  return in;
}

// Accepts on an io_context thread and serves each connection on its own
// worker thread with blocking I/O. At most server.max_connections workers
// run at once; connections past that get a 503.
class ProxyServer {
 public:
  explicit ProxyServer(const Config& config)
      : capture_(config.logging.capture_file.empty() ? fs::path() : expand_user_path(config.logging.capture_file)),
        handler_(config, &capture_),
        acceptor_(ioc_) {}

  ~ProxyServer() { stop(); }

  ProxyServer(const ProxyServer&) = delete;
  ProxyServer& operator=(const ProxyServer&) = delete;

  bool start() {
    if (running_.load()) {
      return true;
    }
    const ServerConfig& sc = handler_.config().server;
    beast::error_code ec;
    const auto address = net::ip::make_address(sc.host, ec);
    if (ec) {
      Logger::log(Logger::Level::kError, "Invalid listen address '" + sc.host + "': " + ec.message());
      return false;
    }
    const tcp::endpoint endpoint{address, static_cast<unsigned short>(sc.port)};

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
      acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
      acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
      acceptor_.listen(net::socket_base::max_listen_connections, ec);
    }
    if (ec) {
      Logger::log(Logger::Level::kError, "Cannot listen on " + sc.host + ":" + std::to_string(sc.port) + ": " +
                                             ec.message());
      beast::error_code ignored;
      acceptor_.close(ignored);
      return false;
    }
    port_ = acceptor_.local_endpoint(ec).port();

    running_.store(true);
    do_accept();
    io_thread_ = std::thread([this]() { ioc_.run(); });
    Logger::log(Logger::Level::kInfo, "Listening on " + sc.host + ":" + std::to_string(port_) + " → " +
                                          handler_.config().backend.url);
    return true;
  }

  // Stops accepting, cuts open client connections and waits for workers.
  void stop() {
    if (!running_.exchange(false)) {
      return;
    }
    net::post(ioc_, [this]() {
      beast::error_code ec;
      acceptor_.close(ec);
    });
    if (io_thread_.joinable()) {
      io_thread_.join();
    }

    std::unique_lock<std::mutex> lock(workers_mu_);
    for (const int fd : active_fds_) {
      ::shutdown(fd, SHUT_RDWR);
    }
    workers_cv_.wait(lock, [this]() { return workers_ == 0; });
  }

  unsigned short port() const { return port_; }
  bool running() const { return running_.load(); }

 private:
  void do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
      if (ec) {
        if (ec != net::error::operation_aborted) {
          Logger::log(Logger::Level::kWarn, "accept failed: " + ec.message());
        }
      } else {
        spawn_worker(std::move(socket));
      }
      if (running_.load() && acceptor_.is_open()) {
        do_accept();
      }
    });
  }

  void spawn_worker(tcp::socket socket) {
    bool admitted = false;
    {
      std::lock_guard<std::mutex> lock(workers_mu_);
      if (workers_ < handler_.config().server.max_connections) {
        ++workers_;
        active_fds_.insert(socket.native_handle());
        admitted = true;
      }
    }
    if (!admitted) {
      reject_busy(socket);
      return;
    }
    auto owned = std::make_unique<tcp::socket>(std::move(socket));
    std::thread([this, sock = std::move(owned)]() mutable {
      serve_connection(*sock);
      std::lock_guard<std::mutex> lock(workers_mu_);
      active_fds_.erase(sock->native_handle());
      beast::error_code ec;
      sock->close(ec);
      // The socket refers to ioc_, which stop() may tear down once workers_ hits zero.
      sock.reset();
      --workers_;
      workers_cv_.notify_all();
    }).detach();
  }

  void serve_connection(tcp::socket& socket) {
    beast::error_code ec;
    socket.set_option(tcp::no_delay(true), ec);
    beast::flat_buffer buffer;

    for (;;) {
      http::request_parser<http::string_body> parser;
      parser.body_limit(kMaxRequestBodyBytes);
      http::read(socket, buffer, parser, ec);
      if (ec) {
        reject_unreadable(socket, ec);
        break;
      }

      auto req = parser.release();
      const unsigned version = req.version();
      const bool keep_alive = req.keep_alive();
      const bool head_only = req.method() == http::verb::head;
      const InboundRequest in = to_inbound(std::move(req));
      SocketChannel channel(socket, version, keep_alive, head_only);

      try {
        handler_.handle(in, channel);
      } catch (const std::exception& e) {
        Logger::log(Logger::Level::kError, in.method + " " + in.target + " failed: " + e.what());
        if (!channel.responded()) {
          channel.send(500, "application/json",
                       json{{"error", {{"type", "internal_error"}, {"message", e.what()}}}}.dump(), HeaderMap{});
        }
        break;
      }
      if (!channel.reusable()) {
        break;
      }
    }

    socket.shutdown(tcp::socket::shutdown_send, ec);
  }

  // Turns a connection away without reading its request; runs on the accept thread.
  void reject_busy(tcp::socket& socket) {
    Logger::log(Logger::Level::kWarn, "connection limit of " +
                                          std::to_string(handler_.config().server.max_connections) +
                                          " reached; answering 503");
    SocketChannel channel(socket, 11, false);
    channel.send(503, "application/json",
                 json{{"error", {{"type", "overloaded"}, {"message", "too many open connections"}}}}.dump(),
                 HeaderMap{{"Retry-After", "1"}});
    beast::error_code ec;
    socket.shutdown(tcp::socket::shutdown_send, ec);
    // Unread request bytes would turn the close into a reset that can discard the reply.
    socket.non_blocking(true, ec);
    char sink[4096];
    for (int i = 0; i < 16 && !ec; ++i) {
      socket.read_some(net::buffer(sink), ec);
    }
    socket.close(ec);
  }

  // Answers requests that could not be read when the client is still there to hear it.
  void reject_unreadable(tcp::socket& socket, const beast::error_code& ec) {
    if (ec == http::error::end_of_stream || ec == http::error::partial_message || ec == net::error::eof ||
        ec == net::error::connection_reset || ec == net::error::operation_aborted ||
        ec == net::error::bad_descriptor || ec == net::error::shut_down) {
      return;
    }
    Logger::log(Logger::Level::kWarn, "unreadable request: " + ec.message());
    if (ec.category() != http::make_error_code(http::error::bad_target).category()) {
      return;
    }
    SocketChannel channel(socket, 11, false);
    const unsigned status = ec == http::error::body_limit ? 413u : 400u;
    channel.send(status, "application/json",
                 json{{"error", {{"type", "bad_request"}, {"message", ec.message()}}}}.dump(), HeaderMap{});
  }

  CaptureLog capture_;
  ProxyHandler handler_;
  net::io_context ioc_;
  tcp::acceptor acceptor_;
  std::thread io_thread_;
  std::atomic<bool> running_{false};
  unsigned short port_{0};

  std::mutex workers_mu_;
  std::condition_variable workers_cv_;
  std::unordered_set<int> active_fds_;
  int workers_{0};
};

}  // namespace kvproxy
