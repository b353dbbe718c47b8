#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "kvproxy/capture_log.hpp"
#include "kvproxy/config.hpp"
#include "kvproxy/http.hpp"
#include "kvproxy/inspect.hpp"
#include "kvproxy/metrics.hpp"
#include "kvproxy/replay.hpp"
#include "kvproxy/server.hpp"

namespace {

using namespace kvproxy;

constexpr const char* kDefaultCaptureFile = "proxy_capture.log";

void print_usage() {
  std::cout
      << "kvproxy - prompt-normalizing proxy for local inference servers\n\n"
      << "Usage:\n"
      << "  kvproxy serve [--config PATH] [--host HOST] [--port PORT] [--backend URL]\n"
      << "                [--capture FILE] [--no-strip-timestamps] [--no-strip-message-ids]\n"
      << "  kvproxy onboard [--config PATH]\n"
      << "  kvproxy status [--config PATH] [--json]\n"
      << "  kvproxy inspect [--log FILE] [--path PATH]\n"
      << "  kvproxy replay [--log FILE] [--proxy URL] [--count N] [--start N] [--api-key KEY] [--no-wait]\n"
      << "  kvproxy metrics [--json]\n"
      << "  kvproxy --version\n";
}

bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
  return std::find(args.begin(), args.end(), flag) != args.end();
}

std::string get_flag_value(const std::vector<std::string>& args, const std::string& flag,
                           const std::string& fallback = "") {
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag) {
      return args[i + 1];
    }
  }
  return fallback;
}

int get_int_flag_value(const std::vector<std::string>& args, const std::string& flag, int fallback, int min_value,
                       int max_value) {
  const std::string raw = trim(get_flag_value(args, flag, std::to_string(fallback)));
  try {
    const int v = std::stoi(raw);
    return std::clamp(v, min_value, max_value);
  } catch (const std::exception&) {
    return fallback;
  }
}

fs::path config_path_from(const std::vector<std::string>& args) {
  const std::string p = trim(get_flag_value(args, "--config"));
  return p.empty() ? get_config_path() : expand_user_path(p);
}

void apply_overrides(const std::vector<std::string>& args, Config& cfg) {
  cfg.server.host = trim(get_flag_value(args, "--host", cfg.server.host));
  cfg.server.port = get_int_flag_value(args, "--port", cfg.server.port, 0, 65535);
  cfg.backend.url = normalize_base_url(get_flag_value(args, "--backend", cfg.backend.url));
  cfg.logging.capture_file = get_flag_value(args, "--capture", cfg.logging.capture_file);
  if (has_flag(args, "--no-strip-timestamps")) {
    cfg.normalize.strip_timestamps = false;
  }
  if (has_flag(args, "--no-strip-message-ids")) {
    cfg.normalize.strip_message_ids = false;
  }
}

void configure_logging(const LoggingConfig& logging) {
  Logger::set_min_level(Logger::parse_level(logging.level));
  const char* v = std::getenv("KVPROXY_LOG_JSON");
  Logger::set_json(logging.json || (v && *v && std::string(v) != "0"));
  if (!trim(logging.file).empty() && !Logger::set_file(expand_user_path(logging.file))) {
    Logger::log(Logger::Level::kWarn, "Cannot open log file " + logging.file + "; logging to stderr only");
  }
}

std::string on_off(bool v) {
  return v ? "on" : "off";
}

int run_serve(const std::vector<std::string>& args) {
  Config cfg = load_config(config_path_from(args));
  apply_overrides(args, cfg);
  configure_logging(cfg.logging);

  ProxyServer server(cfg);
  if (!server.start()) {
    return 1;
  }
  Logger::log(Logger::Level::kInfo, "  strip_timestamps=" + on_off(cfg.normalize.strip_timestamps) +
                                        "  strip_message_ids=" + on_off(cfg.normalize.strip_message_ids));
  if (!cfg.logging.capture_file.empty()) {
    Logger::log(Logger::Level::kInfo, "  capturing requests to " + cfg.logging.capture_file);
  }

  std::atomic<bool> metrics_running{true};
  std::thread metrics_flush([&]() {
    while (metrics_running.load()) {
      write_metrics_snapshot();
      for (int i = 0; metrics_running.load() && i < 50; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    }
  });

  net::io_context signal_ioc;
  net::signal_set signals(signal_ioc, SIGINT, SIGTERM);
  signals.async_wait([](const beast::error_code& ec, int signo) {
    if (!ec) {
      Logger::log(Logger::Level::kInfo, "Received signal " + std::to_string(signo) + ", shutting down");
    }
  });
  signal_ioc.run();

  server.stop();
  metrics_running.store(false);
  if (metrics_flush.joinable()) {
    metrics_flush.join();
  }
  write_metrics_snapshot();
  return 0;
}

int run_onboard(const std::vector<std::string>& args) {
  const fs::path config_path = config_path_from(args);
  if (fs::exists(config_path)) {
    std::cout << "Config already exists: " << config_path.string() << "\n";
    return 0;
  }
  if (!save_default_config(config_path)) {
    std::cerr << "Failed to write config: " << config_path.string() << "\n";
    return 1;
  }
  std::cout << "Created config: " << config_path.string() << "\n";
  std::cout << "Next: point backend.url at your inference server and run: kvproxy serve\n";
  return 0;
}

int run_status(const std::vector<std::string>& args) {
  const fs::path config_path = config_path_from(args);
  const Config cfg = load_config(config_path);

  if (has_flag(args, "--json")) {
    json report = json::object();
    report["configPath"] = config_path.string();
    report["configExists"] = fs::exists(config_path);
    report["listen"] = cfg.server.host + ":" + std::to_string(cfg.server.port);
    report["backend"] = cfg.backend.url;
    report["stripTimestamps"] = cfg.normalize.strip_timestamps;
    report["stripMessageIds"] = cfg.normalize.strip_message_ids;
    report["completionPath"] = cfg.routes.completion;
    report["captureFile"] = cfg.logging.capture_file;
    std::cout << report.dump(2) << "\n";
    return 0;
  }

  std::cout << "kvproxy status\n\n";
  std::cout << "Config: " << config_path.string() << (fs::exists(config_path) ? " [ok]" : " [missing]") << "\n";
  std::cout << "Listen: " << cfg.server.host << ":" << cfg.server.port << "\n";
  std::cout << "Backend: " << cfg.backend.url << " (timeout " << cfg.backend.timeout << "s)\n";
  std::cout << "Strip timestamps: " << on_off(cfg.normalize.strip_timestamps) << "\n";
  std::cout << "Strip message ids: " << on_off(cfg.normalize.strip_message_ids) << "\n";
  std::cout << "Completion path: " << cfg.routes.completion << "\n";
  std::cout << "Capture log: " << (cfg.logging.capture_file.empty() ? "off" : cfg.logging.capture_file) << "\n";
  return 0;
}

std::string capture_path_from(const std::vector<std::string>& args) {
  const Config cfg = load_config(config_path_from(args));
  const std::string fallback = cfg.logging.capture_file.empty() ? kDefaultCaptureFile : cfg.logging.capture_file;
  return get_flag_value(args, "--log", fallback);
}

int run_inspect(const std::vector<std::string>& args) {
  const Config cfg = load_config(config_path_from(args));
  const fs::path log_path = expand_user_path(capture_path_from(args));
  const std::string target = get_flag_value(args, "--path", cfg.routes.completion);

  const std::string content = read_text_file(log_path);
  if (content.empty()) {
    std::cerr << "Cannot read capture log: " << log_path.string() << "\n";
    return 1;
  }

  const auto summaries = summarize_capture(parse_capture_log(content), "POST", target);
  std::cout << "Total request blocks found: " << summaries.size() << "\n\n";
  for (const auto& s : summaries) {
    std::cout << format_summary(s) << "\n";
  }
  return 0;
}

void print_replay_result(const SseCollector& collector, double elapsed_s) {
  char elapsed[32];
  std::snprintf(elapsed, sizeof(elapsed), "%.1f", elapsed_s);
  std::cout << "  Done in " << elapsed << "s\n";
  std::cout << "  Usage:  " << collector.usage().dump() << "\n";
  if (!collector.tool_calls().empty()) {
    std::cout << "  Tools called:";
    for (const auto& name : collector.tool_calls()) {
      std::cout << " " << name;
    }
    std::cout << "\n";
  }
  std::cout << "\n  Model response:\n";
  std::istringstream preview(preview_text(collector.output_text()));
  std::string line;
  while (std::getline(preview, line)) {
    std::cout << "    " << line << "\n";
  }
}

int run_replay(const std::vector<std::string>& args) {
  const Config cfg = load_config(config_path_from(args));
  const fs::path log_path = expand_user_path(capture_path_from(args));
  const std::string default_proxy =
      "http://localhost:" + std::to_string(cfg.server.port) + cfg.routes.completion;
  const std::string proxy_url = get_flag_value(args, "--proxy", default_proxy);
  const int count = get_int_flag_value(args, "--count", 3, 1, 100000);
  const std::string api_key = get_flag_value(args, "--api-key");
  const bool wait = !has_flag(args, "--no-wait");

  std::cout << "Loading requests from log...\n";
  const std::string content = read_text_file(log_path);
  if (content.empty()) {
    std::cerr << "Cannot read capture log: " << log_path.string() << "\n";
    return 1;
  }
  std::vector<ordered_json> bodies = extract_replay_bodies(parse_capture_log(content));
  std::cout << "Found " << bodies.size() << " total captured requests\n\n";
  if (bodies.empty()) {
    return 1;
  }

  std::size_t start = 0;
  if (has_flag(args, "--start")) {
    start = static_cast<std::size_t>(
        get_int_flag_value(args, "--start", 0, 0, static_cast<int>(bodies.size()) - 1));
  } else if (const auto reset = find_session_reset(bodies)) {
    start = *reset;
    std::cout << "Second conversation starts at captured request index " << start << "\n";
  } else {
    std::cout << "Could not find a second conversation (session reset) in the log.\n";
    std::cout << "Replaying from request index 0 instead.\n";
  }

  const std::size_t end = (std::min)(bodies.size(), start + static_cast<std::size_t>(count));
  std::cout << "Replaying " << (end - start) << " requests:\n\n";

  std::map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
      {"Accept", "application/json"},
  };
  if (!api_key.empty()) {
    headers["Authorization"] = "Bearer " + api_key;
  }

  HttpClient client;
  for (std::size_t i = start; i < end; ++i) {
    const std::size_t num = i - start + 1;
    ordered_json& body = bodies[i];
    const auto stream_it = body.find("stream");
    const bool was_stream = stream_it != body.end() && stream_it->is_boolean() && stream_it->get<bool>();
    std::cout << std::string(60, '=') << "\n";
    std::cout << "REQUEST " << num << "/" << (end - start) << "\n";
    std::cout << "  Input:  " << summarize_input(body["input"]) << "\n";
    std::cout << "  Stream: " << (was_stream ? "true" : "false") << "\n";

    body["stream"] = true;
    std::cout << "\n  Sending to proxy... (waiting for response)\n";

    SseCollector collector;
    const auto t0 = std::chrono::steady_clock::now();
    const HttpResponse resp = client.request_stream(
        "POST", proxy_url, body.dump(), headers, HeadHandler{},
        [&](std::string_view bytes) {
          collector.feed(bytes);
          return true;
        },
        300);
    collector.finish();
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    if (!resp.ok()) {
      std::cout << "  ERROR after " << static_cast<int>(elapsed) << "s: " << resp.error << "\n";
      std::cout << "  Is the proxy running at " << proxy_url << "?\n";
    } else {
      if (resp.status >= 400) {
        std::cout << "  HTTP " << resp.status << " from proxy\n";
      }
      print_replay_result(collector, elapsed);
    }

    std::cout << "\n";
    if (wait && i + 1 < end) {
      std::cout << "  >>> Press Enter to send request " << (num + 1) << "...";
      std::string ignored;
      std::getline(std::cin, ignored);
      std::cout << "\n";
    }
  }
  return 0;
}

int run_metrics(const std::vector<std::string>& args) {
  const bool json_out = has_flag(args, "--json");
  const std::string raw = read_text_file(default_metrics_path());
  if (json_out) {
    std::cout << (trim(raw).empty() ? "{}" : raw) << "\n";
    return 0;
  }
  std::cout << (trim(raw).empty() ? "(no metrics snapshot yet)\n" : raw + "\n");
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  if (args.size() <= 1) {
    print_usage();
    return 0;
  }

  const std::string command = args[1];
  const std::vector<std::string> sub(args.begin() + 2, args.end());

  if (command == "--version" || command == "-v") {
    std::cout << "kvproxy v0.1.0\n";
    return 0;
  }
  if (command == "serve") {
    return run_serve(sub);
  }
  if (command == "onboard") {
    return run_onboard(sub);
  }
  if (command == "status") {
    return run_status(sub);
  }
  if (command == "inspect") {
    return run_inspect(sub);
  }
  if (command == "replay") {
    return run_replay(sub);
  }
  if (command == "metrics") {
    return run_metrics(sub);
  }

  print_usage();
  return 1;
}
