#include "beacon/config.hpp"

#include <cstdio>
#include <limits>
#include <random>

#include "nlohmann/json.hpp"

#include "beacon/paths.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace beacon {

namespace {

void reject(const char* key, const char* why) {
  log::Line(log::Level::Warn, "config").kv("status", "default").kv("key", key).kv("reason", why);
}

void read_string(const json& j, const char* key, std::string& out, bool allow_empty = true) {
  auto it = j.find(key);
  if (it == j.end()) return;
  if (!it->is_string()) { reject(key, "not_string"); return; }
  std::string v = it->get<std::string>();
  if (!allow_empty && v.empty()) { reject(key, "empty"); return; }
  out = v;
}

void read_bool(const json& j, const char* key, bool& out) {
  auto it = j.find(key);
  if (it == j.end()) return;
  if (!it->is_boolean()) { reject(key, "not_bool"); return; }
  out = it->get<bool>();
}

// Unsigned integer in [lo, hi]; anything else keeps the default.
template <typename T>
void read_uint(const json& j, const char* key, T& out,
               uint64_t lo = 0, uint64_t hi = std::numeric_limits<T>::max()) {
  auto it = j.find(key);
  if (it == j.end()) return;
  if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<int64_t>() >= 0)) {
    reject(key, "not_unsigned");
    return;
  }
  const uint64_t v = it->get<uint64_t>();
  if (v < lo || v > hi) { reject(key, "out_of_range"); return; }
  out = static_cast<T>(v);
}

} // namespace

fs::path default_config_path() {
  return config_dir() / "config.json";
}

bool load_config(const fs::path& path, SessionConfig& cfg) {
  std::string text;
  if (!read_file(path, text)) return true;          // first run

  json j;
  try {
    j = json::parse(text);
  } catch (const json::exception& e) {
    log::Line(log::Level::Error, "config").kv("status", "error").kv("reason", "parse")
        .kv("path", path.string()).kv("detail", e.what());
    return false;
  }
  if (!j.is_object()) {
    log::Line(log::Level::Error, "config").kv("status", "error").kv("reason", "not_object")
        .kv("path", path.string());
    return false;
  }

  read_string(j, "deviceId", cfg.device_id);
  read_string(j, "deviceName", cfg.device_name, false);
  read_string(j, "deviceType", cfg.device_type);
  read_bool(j, "emergency", cfg.emergency);

  std::string lvl;
  read_string(j, "logLevel", lvl);
  if (!lvl.empty() && !log::parse_level(lvl, cfg.log_level)) reject("logLevel", "unknown_level");

  read_uint(j, "tcpPort", cfg.tcp_port, 1);
  read_uint(j, "udpPort", cfg.udp_port, 1);
  read_string(j, "bindAddress", cfg.bind_address);
  read_string(j, "broadcastAddress", cfg.broadcast_address, false);

  read_uint(j, "settleDelayMs", cfg.settle_delay_ms);
  read_uint(j, "connectTimeoutMs", cfg.connect_timeout_ms, 1);
  read_uint(j, "acceptTimeoutMs", cfg.accept_timeout_ms, 1);
  read_uint(j, "retryAttempts", cfg.retry_attempts, 1, 16);
  read_uint(j, "retryBaseMs", cfg.retry_base_ms);
  read_uint(j, "retryMaxMs", cfg.retry_max_ms);
  if (cfg.retry_max_ms < cfg.retry_base_ms) {
    reject("retryMaxMs", "below_base");
    cfg.retry_max_ms = cfg.retry_base_ms;
  }

  read_uint(j, "beaconIntervalMs", cfg.beacon_interval_ms, 100);
  read_uint(j, "peerExpiryMs", cfg.peer_expiry_ms, 500);
  read_string(j, "dataDir", cfg.data_dir);
  return true;
}

bool save_config(const fs::path& path, const SessionConfig& cfg) {
  json j{
    {"deviceId",         cfg.device_id},
    {"deviceName",       cfg.device_name},
    {"deviceType",       cfg.device_type},
    {"emergency",        cfg.emergency},
    {"logLevel",         log::level_name(cfg.log_level)},
    {"tcpPort",          cfg.tcp_port},
    {"udpPort",          cfg.udp_port},
    {"bindAddress",      cfg.bind_address},
    {"broadcastAddress", cfg.broadcast_address},
    {"settleDelayMs",    cfg.settle_delay_ms},
    {"connectTimeoutMs", cfg.connect_timeout_ms},
    {"acceptTimeoutMs",  cfg.accept_timeout_ms},
    {"retryAttempts",    cfg.retry_attempts},
    {"retryBaseMs",      cfg.retry_base_ms},
    {"retryMaxMs",       cfg.retry_max_ms},
    {"beaconIntervalMs", cfg.beacon_interval_ms},
    {"peerExpiryMs",     cfg.peer_expiry_ms},
    {"dataDir",          cfg.data_dir},
  };
  return write_file_atomic(path, j.dump(2, ' ', false, json::error_handler_t::replace) + "\n");
}

std::string generate_device_id() {
  std::random_device rd;
  std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd());
  const uint64_t v = gen() & 0xFFFFFFFFFFFFull;           // 48 bits
  char buf[20];
  std::snprintf(buf, sizeof(buf), "bcn-%012llx", static_cast<unsigned long long>(v));
  return buf;
}

bool ensure_device_id(const fs::path& path, SessionConfig& cfg) {
  if (!cfg.device_id.empty()) return true;
  cfg.device_id = generate_device_id();
  log::Line(log::Level::Info, "config").kv("status", "generated").kv("device_id", cfg.device_id);
  return save_config(path, cfg);
}

} // namespace beacon
