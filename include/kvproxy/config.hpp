#pragma once

#include <string>

#include "kvproxy/common.hpp"

namespace kvproxy {

struct ServerConfig {
  std::string host{"0.0.0.0"};
  int port{1234};
  int max_connections{256};
};

struct BackendConfig {
  std::string url{"http://localhost:12345"};
  int timeout{300};
  int models_timeout{30};
};

// Which volatile fragments the Normalizer removes.
struct NormalizeOptions {
  bool strip_timestamps{true};
  bool strip_message_ids{true};
};

struct RoutesConfig {
  std::string completion{"/v1/responses"};
  std::string models{"/v1/models"};
  std::string health{"/health"};
};

struct LoggingConfig {
  std::string level{"info"};
  bool json{false};
  std::string file{"proxy.log"};
  std::string capture_file;
};

struct Config {
  ServerConfig server{};
  BackendConfig backend{};
  NormalizeOptions normalize{};
  RoutesConfig routes{};
  LoggingConfig logging{};
};

inline std::string resolve_env_ref(const std::string& value) {
  if (value.empty()) {
    return "";
  }

  // Supports "$ENV_NAME" and "${ENV_NAME}".
  if (value[0] != '$') {
    return value;
  }

  std::string env_name = value.substr(1);
  if (!env_name.empty() && env_name.front() == '{' && env_name.back() == '}') {
    env_name = env_name.substr(1, env_name.size() - 2);
  }
  if (env_name.empty()) {
    return value;
  }

  const char* v = std::getenv(env_name.c_str());
  return (v && *v) ? std::string(v) : "";
}

inline fs::path get_data_dir() {
  return expand_user_path("~/.kvproxy");
}

inline fs::path get_config_path() {
  return get_data_dir() / "config.json";
}

inline json default_config_json() {
  return json{
      {"server", {{"host", "0.0.0.0"}, {"port", 1234}, {"maxConnections", 256}}},
      {"backend", {{"url", "http://localhost:12345"}, {"timeout", 300}, {"modelsTimeout", 30}}},
      {"normalize", {{"stripTimestamps", true}, {"stripMessageIds", true}}},
      {"routes", {{"completion", "/v1/responses"}, {"models", "/v1/models"}, {"health", "/health"}}},
      {"logging", {{"level", "info"}, {"json", false}, {"file", "proxy.log"}, {"captureFile", ""}}},
  };
}

// Strips a trailing '/' so paths can be appended verbatim.
inline std::string normalize_base_url(std::string url) {
  url = trim(url);
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

inline Config config_from_json(const json& root) {
  Config cfg{};

  if (root.contains("server") && root["server"].is_object()) {
    const auto& s = root["server"];
    cfg.server.host = resolve_env_ref(s.value("host", cfg.server.host));
    cfg.server.port = s.value("port", cfg.server.port);
    cfg.server.max_connections = (std::max)(1, s.value("maxConnections", cfg.server.max_connections));
  }

  if (root.contains("backend") && root["backend"].is_object()) {
    const auto& b = root["backend"];
    cfg.backend.url = resolve_env_ref(b.value("url", cfg.backend.url));
    cfg.backend.timeout = (std::max)(1, b.value("timeout", cfg.backend.timeout));
    cfg.backend.models_timeout = (std::max)(1, b.value("modelsTimeout", cfg.backend.models_timeout));
  }
  cfg.backend.url = normalize_base_url(cfg.backend.url);

  if (root.contains("normalize") && root["normalize"].is_object()) {
    const auto& n = root["normalize"];
    cfg.normalize.strip_timestamps = n.value("stripTimestamps", cfg.normalize.strip_timestamps);
    cfg.normalize.strip_message_ids = n.value("stripMessageIds", cfg.normalize.strip_message_ids);
  }

  if (root.contains("routes") && root["routes"].is_object()) {
    const auto& r = root["routes"];
    cfg.routes.completion = r.value("completion", cfg.routes.completion);
    cfg.routes.models = r.value("models", cfg.routes.models);
    cfg.routes.health = r.value("health", cfg.routes.health);
  }

  if (root.contains("logging") && root["logging"].is_object()) {
    const auto& l = root["logging"];
    cfg.logging.level = l.value("level", cfg.logging.level);
    cfg.logging.json = l.value("json", cfg.logging.json);
    cfg.logging.file = resolve_env_ref(l.value("file", cfg.logging.file));
    cfg.logging.capture_file = resolve_env_ref(l.value("captureFile", cfg.logging.capture_file));
  }

  return cfg;
}

inline Config load_config(const fs::path& path = get_config_path()) {
  const std::string raw = read_text_file(path);
  if (trim(raw).empty()) {
    return Config{};
  }

  try {
    return config_from_json(json::parse(raw));
  } catch (const std::exception& e) {
    Logger::log(Logger::Level::kWarn, std::string("Failed to parse config: ") + e.what());
  }
  return Config{};
}

inline bool save_default_config(const fs::path& path = get_config_path()) {
  return write_text_file(path, default_config_json().dump(2));
}

}  // namespace kvproxy
