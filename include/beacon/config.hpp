#pragma once
/**
 * @file config.hpp
 * @brief Session settings: defaults, the JSON config file, and the device id.
 *
 * @details
 * File: `config_dir()/config.json`. Every key is optional; unknown keys are
 * ignored; a key with the wrong type or an out-of-range value keeps its
 * default and is logged. beacon-cli applies its command-line overrides on
 * top of what is loaded here.
 *
 * @code
 *   {
 *     "deviceId": "bcn-4f1c9a0b27d3",
 *     "deviceName": "Rescue Laptop 2",
 *     "deviceType": "laptop",
 *     "emergency": true,
 *     "logLevel": "info",
 *     "tcpPort": 8888,
 *     "udpPort": 8889,
 *     "connectTimeoutMs": 5000
 *   }
 * @endcode
 *
 * A device needs a stable id across restarts. ensure_device_id() generates
 * one the first time and writes it back atomically.
 */

#include <cstdint>
#include <filesystem>
#include <string>

#include "beacon/log.hpp"

namespace beacon {

struct SessionConfig {
  std::string device_id;
  std::string device_name{"Beacon Device"};
  std::string device_type{"laptop"};
  bool        emergency{false};

  log::Level  log_level{log::Level::Info};

  uint16_t    tcp_port{8888};
  uint16_t    udp_port{8889};
  std::string bind_address;
  std::string broadcast_address{"255.255.255.255"};

  uint32_t    settle_delay_ms{500};
  uint32_t    connect_timeout_ms{5000};
  uint32_t    accept_timeout_ms{30000};
  uint32_t    retry_attempts{3};
  uint32_t    retry_base_ms{1000};
  uint32_t    retry_max_ms{4000};

  uint32_t    beacon_interval_ms{1000};
  uint32_t    peer_expiry_ms{5000};

  std::string data_dir;              ///< Empty: data_dir().
};

std::filesystem::path default_config_path();

/**
 * @brief Overlay @p path onto @p cfg.
 * @return false if the file exists but is not a JSON object (cfg unchanged).
 *         A missing file is not an error.
 */
bool load_config(const std::filesystem::path& path, SessionConfig& cfg);

bool save_config(const std::filesystem::path& path, const SessionConfig& cfg);

/// "bcn-" + 12 lowercase hex digits.
std::string generate_device_id();

/**
 * @brief Give @p cfg a device id if it has none, persisting it to @p path.
 * @return false only when an id was generated but could not be saved
 *         (the id is still set for this run).
 */
bool ensure_device_id(const std::filesystem::path& path, SessionConfig& cfg);

} // namespace beacon
